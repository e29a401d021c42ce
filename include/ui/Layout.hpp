#pragma once

namespace listui::ui {

struct LayoutRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool empty() const { return width <= 0 || height <= 0; }
    bool operator==(const LayoutRect& other) const = default;
};

// Splits `rect` into a top part and a bottom part of `bottom_height` rows.
inline void split_bottom(const LayoutRect& rect, int bottom_height, LayoutRect& top, LayoutRect& bottom) {
    if (bottom_height > rect.height) bottom_height = rect.height;
    if (bottom_height < 0) bottom_height = 0;
    top = {rect.x, rect.y, rect.width, rect.height - bottom_height};
    bottom = {rect.x, rect.y + top.height, rect.width, bottom_height};
}

// A `width` x `height` rectangle centered in `outer`, clipped to it.
inline LayoutRect centered(const LayoutRect& outer, int width, int height) {
    if (width > outer.width) width = outer.width;
    if (height > outer.height) height = outer.height;
    return {outer.x + (outer.width - width) / 2, outer.y + (outer.height - height) / 2, width, height};
}

}  // namespace listui::ui
