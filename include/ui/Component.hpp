#pragma once

#include "collectors/PlaylistImporter.hpp"
#include "config/KeyMap.hpp"
#include "core/PlaybackEngine.hpp"
#include "model/Library.hpp"
#include "ui/Canvas.hpp"
#include "ui/InputEvent.hpp"
#include "ui/Layout.hpp"
#include <string>
#include <vector>

namespace listui::ui {

// Everything a widget may read while drawing one frame.
struct ShellView {
    const core::PlaybackEngine& engine;
    const std::vector<model::Playlist>& playlists;
    const collectors::PlaylistImporter::Status& import;
    const config::KeyMap& keys;
};

/**
 * Base class for the shell's widgets.
 *
 * Widgets draw into a Canvas inside the rectangle the shell assigned to them
 * and keep only view state (selection, scroll, filter). Playback state is
 * always read from the engine through the ShellView.
 */
class Component {
public:
    virtual ~Component() = default;

    virtual void render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) = 0;

    // Returns true when the event was consumed.
    virtual bool handle_input(const InputEvent& event) {
        (void)event;
        return false;
    }

protected:
    /**
     * Draws a rounded border with the title on its top edge.
     * Returns the content rectangle inside the border.
     */
    LayoutRect draw_box_border(Canvas& canvas, const LayoutRect& rect, const std::string& title,
                               bool focused = false) const;

    // Draws `text` truncated or padded to exactly `width` columns.
    void draw_line(Canvas& canvas, int x, int y, int width, const std::string& text, Style style = {}) const;

    // Adjusts `scroll` so that row `selected` is inside a window of `visible` rows.
    static void keep_visible(int selected, int count, int visible, int& scroll);
};

}  // namespace listui::ui
