#include "ui/Component.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>

namespace listui::ui {

LayoutRect Component::draw_box_border(Canvas& canvas, const LayoutRect& rect, const std::string& title,
                                      bool focused) const {
    canvas.draw_rect(rect, focused ? Style{Color::Yellow} : Style{});

    if (!title.empty() && rect.width > 6) {
        canvas.draw_text(rect.x + 2, rect.y, " " + take_cols(title, rect.width - 6) + " ",
                         focused ? styles::kFocusTitle : styles::kTitle, rect.x + rect.width - 1);
    }

    return LayoutRect{rect.x + 1, rect.y + 1, std::max(rect.width - 2, 0), std::max(rect.height - 2, 0)};
}

void Component::draw_line(Canvas& canvas, int x, int y, int width, const std::string& text, Style style) const {
    if (width <= 0) return;
    canvas.draw_text(x, y, trunc_pad(text, width), style, x + width);
}

void Component::keep_visible(int selected, int count, int visible, int& scroll) {
    if (visible < 1) visible = 1;
    if (selected < scroll) {
        scroll = selected;
    } else if (selected >= scroll + visible) {
        scroll = selected - visible + 1;
    }
    scroll = std::clamp(scroll, 0, std::max(0, count - visible));
}

}  // namespace listui::ui
