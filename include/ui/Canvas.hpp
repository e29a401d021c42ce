#pragma once

#include "ui/Color.hpp"
#include "ui/Layout.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace listui::ui {

/**
 * A single cell on the terminal grid.
 * Double-width characters occupy two cells; the second one has empty content.
 */
struct Cell {
    std::string content = " ";
    Style style;

    bool operator==(const Cell& other) const {
        return content == other.content && style == other.style;
    }

    bool operator!=(const Cell& other) const {
        return !(*this == other);
    }
};

/**
 * A 2D grid of Cells representing one frame.
 * Origin (0,0) is top-left. Writes outside the grid are ignored.
 */
class Canvas {
public:
    Canvas(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    Cell& at(int x, int y);
    const Cell& at(int x, int y) const;

    void clear(const Cell& fill_cell = Cell{" ", {}});
    void put(int x, int y, const std::string& grapheme, Style style = {});

    // Draws UTF-8 text starting at x, stopping before column `limit_x`
    // (the canvas width when negative). Returns the column after the last character.
    int draw_text(int x, int y, std::string_view text, Style style = {}, int limit_x = -1);

    // Rounded box outline
    void draw_rect(const LayoutRect& rect, Style style = {});
    void fill_rect(const LayoutRect& rect, const Cell& cell);
    void hline(int x, int y, int width, const std::string& grapheme, Style style = {});

    // Resize the canvas (clears content)
    void resize(int width, int height);

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Cell> buffer_;

    bool is_in_bounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
};

}  // namespace listui::ui
