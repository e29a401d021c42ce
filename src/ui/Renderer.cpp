#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <format>

namespace listui::ui {

Renderer::Renderer() : canvas_(1, 1), prev_canvas_(1, 1) {}

Canvas& Renderer::begin_frame(int cols, int rows) {
    if (cols != canvas_.width() || rows != canvas_.height()) {
        canvas_.resize(cols, rows);
        prev_canvas_.resize(cols, rows);
        full_redraw_ = true;
        util::Logger::debug(std::format("Renderer: Resized to {}x{}", cols, rows));
    }
    canvas_.clear();
    return canvas_;
}

void Renderer::present() {
    auto& terminal = Terminal::instance();
    if (full_redraw_) terminal.clear_screen();

    // Runs of changed cells on a row go out as one write
    for (int y = 0; y < canvas_.height(); ++y) {
        int x = 0;
        while (x < canvas_.width()) {
            if (!full_redraw_ && canvas_.at(x, y) == prev_canvas_.at(x, y)) {
                ++x;
                continue;
            }

            // A run never starts on the second half of a wide character
            bool include_next = false;
            if (x > 0 && canvas_.at(x, y).content.empty()) {
                --x;
                include_next = true;
            }

            const int start = x;
            std::string output;
            const Style* current = nullptr;
            while (x < canvas_.width() &&
                   (include_next || full_redraw_ || canvas_.at(x, y) != prev_canvas_.at(x, y))) {
                include_next = false;
                const auto& cell = canvas_.at(x, y);
                if (!current || !(*current == cell.style)) {
                    output += "\033[0m";
                    output += to_sgr(cell.style);
                    current = &cell.style;
                }
                output += cell.content;  // Empty for the second half of a wide character
                ++x;
            }
            output += "\033[0m";
            terminal.print(start, y, output);
        }
    }

    prev_canvas_ = canvas_;
    full_redraw_ = false;
}

}  // namespace listui::ui
