#pragma once

#include "ui/Canvas.hpp"

namespace listui::ui {

// Double-buffered output: widgets draw into the frame canvas and present()
// writes only the cells that differ from the previous frame.
class Renderer {
public:
    Renderer();

    // Resizes (forcing a full redraw) and clears the frame canvas.
    Canvas& begin_frame(int cols, int rows);
    void present();

    // The next present() repaints every cell.
    void invalidate() { full_redraw_ = true; }

private:
    Canvas canvas_;
    Canvas prev_canvas_;
    bool full_redraw_ = true;
};

}  // namespace listui::ui
