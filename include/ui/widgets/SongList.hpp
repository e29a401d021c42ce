#pragma once

#include "ui/Component.hpp"
#include <optional>
#include <string>
#include <vector>

namespace listui::ui::widgets {

// Tracks of the open playlist in play order, with per-track download and playback markers.
// While a search is active only matching tracks are listed.
class SongList : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) override;

    // Arrow keys, and query editing while searching.
    bool handle_input(const InputEvent& event) override;

    // The engine's order changed; rows are rebuilt on the next sync().
    void invalidate() { dirty_ = true; }
    void reset();

    void start_search();
    void clear_filter();
    [[nodiscard]] bool searching() const { return searching_; }
    [[nodiscard]] const std::string& query() const { return query_; }

    // Selection follows the playing track until the user moves it.
    void set_follow(bool follow) { follow_ = follow; }
    [[nodiscard]] bool following() const { return follow_; }

    // Rebuilds rows and applies follow mode.
    void sync(const core::PlaybackEngine& engine);

    // Position in the play order of the selected row.
    [[nodiscard]] std::optional<size_t> selected_position() const;
    [[nodiscard]] size_t visible_rows() const { return rows_.size(); }

private:
    void rebuild(const core::PlaybackEngine& engine);

    std::vector<size_t> rows_;  // Order positions shown, top to bottom
    std::string query_;
    bool searching_ = false;
    bool follow_ = true;
    bool dirty_ = true;
    int selected_index_ = 0;
    int scroll_offset_ = 0;
};

}  // namespace listui::ui::widgets
