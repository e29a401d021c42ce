#pragma once

#include "ui/Component.hpp"

namespace listui::ui::widgets {

// Shown while a playlist is being resolved: the instance being queried and the videos fetched so far.
class LoadingView : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) override;
};

}  // namespace listui::ui::widgets
