#pragma once

#include "ui/Component.hpp"

namespace listui::ui::widgets {

// Key reference for the screen that was active when help was opened.
class HelpOverlay : public Component {
public:
    enum class Context { Playlists, Songs };

    void render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) override;

    void set_context(Context context) { context_ = context; }

private:
    Context context_ = Context::Playlists;
};

}  // namespace listui::ui::widgets
