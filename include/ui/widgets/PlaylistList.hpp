#pragma once

#include "ui/Component.hpp"
#include <optional>

namespace listui::ui::widgets {

// The stored playlists, one per row.
class PlaylistList : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) override;
    bool handle_input(const InputEvent& event) override;

    // Keeps the selection inside a list of `count` rows.
    void set_count(size_t count);
    void select(size_t index);
    [[nodiscard]] std::optional<size_t> selected() const;

private:
    size_t count_ = 0;
    int selected_index_ = 0;
    int scroll_offset_ = 0;
};

}  // namespace listui::ui::widgets
