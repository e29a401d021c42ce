#include "ui/widgets/SongList.hpp"
#include "ui/Formatting.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cmath>

namespace listui::ui::widgets {

namespace {

constexpr int kMarkerCols = 7;

struct Marker {
    std::string text;
    Style style;
};

Marker marker_for(const core::PlaybackEngine& engine, const model::Track& track, bool is_current) {
    if (is_current) {
        switch (engine.state()) {
            case model::PlaybackState::Playing: return {"▶", styles::kPlaying};
            case model::PlaybackState::Paused:  return {"‖", styles::kPlaying};
            case model::PlaybackState::Stopped: break;
        }
    }

    switch (engine.slot_state(track.id)) {
        case model::SlotState::Fetching: {
            auto task = engine.download(track.id);
            int percent = task ? static_cast<int>(std::floor(task->progress * 100.0)) : 0;
            return {"↓ " + std::to_string(percent) + "%", styles::kAccent};
        }
        case model::SlotState::Failed:
            return {"✗", Style{Color::Red, Color::Default, Attribute::Bold}};
        case model::SlotState::Resolved:
            if (track.is_remote()) return {"✓", Style{Color::Green}};
            break;
        case model::SlotState::Unresolved:
            break;
    }
    return {};
}

std::string mode_badges(const core::PlaybackEngine& engine) {
    std::string badges;
    if (engine.shuffle()) badges += " ⤨";
    switch (engine.repeat()) {
        case model::RepeatMode::All: badges += " ⟳"; break;
        case model::RepeatMode::One: badges += " ⟳1"; break;
        case model::RepeatMode::Off: break;
    }
    return badges;
}

}  // namespace

void SongList::reset() {
    rows_.clear();
    query_.clear();
    searching_ = false;
    follow_ = true;
    dirty_ = true;
    selected_index_ = 0;
    scroll_offset_ = 0;
}

void SongList::start_search() {
    searching_ = true;
    follow_ = false;
    query_.clear();
    dirty_ = true;
    selected_index_ = 0;
    scroll_offset_ = 0;
}

void SongList::clear_filter() {
    if (!searching_ && query_.empty()) return;
    searching_ = false;
    query_.clear();
    dirty_ = true;
}

bool SongList::handle_input(const InputEvent& event) {
    if (event.is_key("up")) {
        follow_ = false;
        if (selected_index_ > 0) selected_index_--;
        return true;
    }
    if (event.is_key("down")) {
        follow_ = false;
        if (selected_index_ + 1 < static_cast<int>(rows_.size())) selected_index_++;
        return true;
    }

    if (!searching_) return false;

    if (event.is_key("escape")) {
        clear_filter();
        return true;
    }
    if (event.is_key("backspace")) {
        if (!query_.empty()) {
            // Drop one whole UTF-8 character
            size_t cut = query_.size() - 1;
            while (cut > 0 && (static_cast<unsigned char>(query_[cut]) & 0xC0) == 0x80) --cut;
            query_.erase(cut);
            dirty_ = true;
            selected_index_ = 0;
        }
        return true;
    }
    if (event.is_printable()) {
        query_ += event.key_name;
        dirty_ = true;
        selected_index_ = 0;
        return true;
    }
    return false;
}

void SongList::rebuild(const core::PlaybackEngine& engine) {
    const auto& order = engine.order();
    rows_.clear();
    rows_.reserve(order.size());

    for (size_t pos = 0; pos < order.size(); ++pos) {
        if (!query_.empty()) {
            const auto* track = engine.track(order.track_ids[pos]);
            if (!track || !util::matches_search(track->title, query_)) continue;
        }
        rows_.push_back(pos);
    }
    dirty_ = false;

    if (!query_.empty()) {
        util::Logger::debug("SongList: Filtered " + std::to_string(order.size()) + " -> " +
                            std::to_string(rows_.size()) + " (query: '" + query_ + "')");
    }
    if (selected_index_ >= static_cast<int>(rows_.size())) {
        selected_index_ = std::max(0, static_cast<int>(rows_.size()) - 1);
    }
}

void SongList::sync(const core::PlaybackEngine& engine) {
    if (dirty_) rebuild(engine);

    if (follow_ && !engine.order().empty()) {
        auto it = std::find(rows_.begin(), rows_.end(), engine.cursor());
        if (it != rows_.end()) selected_index_ = static_cast<int>(it - rows_.begin());
    }
}

std::optional<size_t> SongList::selected_position() const {
    if (rows_.empty() || selected_index_ >= static_cast<int>(rows_.size())) return std::nullopt;
    return rows_[selected_index_];
}

void SongList::render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) {
    const auto& engine = view.engine;
    sync(engine);

    std::string title = engine.playlist_title() + mode_badges(engine);
    if (searching_) {
        title = "≫  Search: " + query_ + "  [" + std::to_string(rows_.size()) + "/" +
                std::to_string(engine.order().size()) + "]";
    }
    auto inner = draw_box_border(canvas, rect, title, true);
    if (inner.empty()) return;

    if (rows_.empty()) {
        draw_line(canvas, inner.x + 1, inner.y, inner.width - 1,
                  searching_ ? "(no matches)" : "This playlist has no songs.", styles::kDim);
        return;
    }

    const int total = static_cast<int>(rows_.size());
    keep_visible(selected_index_, total, inner.height, scroll_offset_);

    const auto& order = engine.order();
    const auto current = engine.current_track_id();
    const int end = std::min(total, scroll_offset_ + inner.height);

    for (int i = scroll_offset_; i < end; ++i) {
        const auto* track = engine.track(order.track_ids[rows_[i]]);
        if (!track) continue;

        const int y = inner.y + (i - scroll_offset_);
        const bool is_cursor = i == selected_index_;
        const bool is_current = current == track->id;

        canvas.draw_text(inner.x, y, is_cursor ? ">> " : "   ", styles::kSelected);

        auto mark = marker_for(engine, *track, is_current);
        draw_line(canvas, inner.x + 3, y, kMarkerCols, mark.text, mark.style);

        Style title_style;
        if (is_cursor) title_style = styles::kSelected;
        else if (is_current) title_style = styles::kPlaying;
        else if (engine.slot_state(track->id) == model::SlotState::Failed) title_style = styles::kDim;

        const int title_x = inner.x + 3 + kMarkerCols;
        draw_line(canvas, title_x, y, inner.x + inner.width - title_x, track->title, title_style);
    }
}

}  // namespace listui::ui::widgets
