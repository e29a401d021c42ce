#include "ui/widgets/PlaylistList.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>

namespace listui::ui::widgets {

void PlaylistList::set_count(size_t count) {
    count_ = count;
    if (selected_index_ >= static_cast<int>(count_)) {
        selected_index_ = std::max(0, static_cast<int>(count_) - 1);
    }
}

void PlaylistList::select(size_t index) {
    if (index < count_) selected_index_ = static_cast<int>(index);
}

std::optional<size_t> PlaylistList::selected() const {
    if (count_ == 0) return std::nullopt;
    return static_cast<size_t>(selected_index_);
}

bool PlaylistList::handle_input(const InputEvent& event) {
    if (event.is_key("up")) {
        if (selected_index_ > 0) selected_index_--;
        return true;
    }
    if (event.is_key("down")) {
        if (selected_index_ + 1 < static_cast<int>(count_)) selected_index_++;
        return true;
    }
    return false;
}

void PlaylistList::render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) {
    set_count(view.playlists.size());

    std::string help_key = view.keys.key_for("help");
    auto inner = draw_box_border(canvas, rect, "Playlists (press " + help_key + " for help)", true);
    if (inner.empty()) return;

    if (view.playlists.empty()) {
        draw_line(canvas, inner.x + 1, inner.y, inner.width - 1,
                  "No playlists yet. Start listui with a playlist URL to import one.", styles::kDim);
        return;
    }

    int total = static_cast<int>(view.playlists.size());
    keep_visible(selected_index_, total, inner.height, scroll_offset_);

    int end = std::min(total, scroll_offset_ + inner.height);
    for (int i = scroll_offset_; i < end; ++i) {
        const auto& playlist = view.playlists[i];
        const bool is_cursor = i == selected_index_;
        int y = inner.y + (i - scroll_offset_);

        std::string count = std::to_string(playlist.track_count) + (playlist.track_count == 1 ? " song" : " songs");
        std::string line = lr_align(inner.width - 3, playlist.title, count);

        canvas.draw_text(inner.x, y, is_cursor ? ">> " : "   ", is_cursor ? styles::kSelected : Style{});
        draw_line(canvas, inner.x + 3, y, inner.width - 3, line, is_cursor ? styles::kSelected : Style{});
    }
}

}  // namespace listui::ui::widgets
