#pragma once

#include "ui/Component.hpp"

namespace listui::ui::widgets {

// Current track, its playback or download progress, volume and modes.
class PlayerBar : public Component {
public:
    static constexpr int kHeight = 5;

    void render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) override;
};

}  // namespace listui::ui::widgets
