#include "ui/widgets/HelpOverlay.hpp"
#include <utility>
#include <vector>

namespace listui::ui::widgets {

void HelpOverlay::render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) {
    const auto& keys = view.keys;
    auto key = [&keys](const char* action) { return keys.key_for(action); };

    std::vector<std::pair<std::string, std::string>> rows;
    if (context_ == Context::Playlists) {
        rows = {
            {"↑/↓", "Move selection"},
            {"Enter", "Open playlist"},
            {key("refresh"), "Refresh playlist from YouTube"},
            {key("delete"), "Delete playlist"},
            {key("help"), "Show this help"},
            {key("back"), "Quit"},
        };
    } else {
        rows = {
            {"↑/↓", "Move selection"},
            {"Enter", "Play selected song"},
            {key("pause"), "Pause / resume"},
            {key("next") + " / " + key("prev"), "Next / previous song"},
            {key("shuffle"), "Toggle shuffle"},
            {key("repeat"), "Cycle repeat (off, all, one)"},
            {key("follow"), "Follow the playing song"},
            {key("search"), "Search (Esc clears)"},
            {"←/→", "Rewind / forward"},
            {"0-9", "Jump to 0-90% of the song"},
            {key("volume_up") + " / " + key("volume_down"), "Volume up / down"},
            {key("help"), "Show this help"},
            {key("back"), "Close playlist"},
        };
    }

    int box_height = static_cast<int>(rows.size()) + 4;
    auto help_rect = centered(rect, 56, box_height);
    canvas.fill_rect(help_rect, Cell{" ", Style{Color::Default, Color::Black}});

    auto content = draw_box_border(canvas, help_rect, "Help");
    if (content.empty()) return;

    Style key_style{Color::BrightCyan, Color::Black, Attribute::Bold};
    Style text_style{Color::BrightWhite, Color::Black};
    Style hint_style{Color::White, Color::Black, Attribute::Dim};

    int y = content.y + 1;
    for (const auto& [keys_text, description] : rows) {
        if (y >= content.y + content.height - 1) break;
        draw_line(canvas, content.x + 2, y, 14, keys_text, key_style);
        draw_line(canvas, content.x + 16, y, content.width - 17, description, text_style);
        ++y;
    }
    draw_line(canvas, content.x + 2, content.y + content.height - 1, content.width - 3, "Press any key to close",
              hint_style);
}

}  // namespace listui::ui::widgets
