#include "ui/widgets/PlayerBar.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>

namespace listui::ui::widgets {

void PlayerBar::render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) {
    const auto& engine = view.engine;
    auto inner = draw_box_border(canvas, rect, "Player");
    if (inner.height < 3) return;

    const auto current = engine.current_track_id();
    const auto* track = current ? engine.track(*current) : nullptr;

    // Title
    if (track) {
        draw_line(canvas, inner.x + 1, inner.y, inner.width - 2, track->title, styles::kTitle);
    } else {
        draw_line(canvas, inner.x + 1, inner.y, inner.width - 2, "No song selected.", styles::kDim);
    }

    // Gauge
    std::string label;
    double ratio = 0.0;
    Style bar_style{Color::Cyan};

    if (track) {
        auto slot = engine.slot_state(track->id);
        if (slot == model::SlotState::Fetching) {
            auto task = engine.download(track->id);
            ratio = task ? task->progress : 0.0;
            label = "Downloading... " + std::to_string(static_cast<int>(ratio * 100.0)) + "%";
            bar_style = Style{Color::Blue};
        } else if (slot == model::SlotState::Failed) {
            label = engine.failure_reason(track->id);
            if (label.empty()) label = "Failed";
            bar_style = Style{Color::Red};
        } else if (engine.state() != model::PlaybackState::Stopped) {
            if (engine.duration_ms() > 0) {
                ratio = static_cast<double>(engine.position_ms()) / static_cast<double>(engine.duration_ms());
            }
            label = time_label(engine.position_ms(), engine.duration_ms());
            if (engine.state() == model::PlaybackState::Paused) label += "  (paused)";
        }
    }

    const int label_cols = std::min(display_cols(label), std::max(inner.width - 4, 0));
    const int bar_cols = std::max(inner.width - 2 - label_cols - 1, 0);
    int x = inner.x + 1;
    x = canvas.draw_text(x, inner.y + 1, progress_bar(ratio, bar_cols), bar_style, inner.x + inner.width - 1);
    if (label_cols > 0) {
        draw_line(canvas, x + 1, inner.y + 1, label_cols, label,
                  bar_style.fg == Color::Red ? Style{Color::Red} : Style{});
    }

    // Status
    std::string left = "Volume: " + std::to_string(engine.volume()) + "%";
    std::string right = std::string("Shuffle: ") + (engine.shuffle() ? "on" : "off") +
                        "  Repeat: " + std::string(model::to_string(engine.repeat())) +
                        "  (press " + view.keys.key_for("help") + " for help)";
    draw_line(canvas, inner.x + 1, inner.y + 2, inner.width - 2, lr_align(inner.width - 2, left, right), styles::kDim);
}

}  // namespace listui::ui::widgets
