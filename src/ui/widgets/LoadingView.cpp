#include "ui/widgets/LoadingView.hpp"
#include "ui/Formatting.hpp"
#include <chrono>

namespace listui::ui::widgets {

namespace {

const char* const kSpinner[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
constexpr int kSpinnerFrames = 10;

void draw_centered(Canvas& canvas, const LayoutRect& rect, int y, const std::string& text, Style style) {
    std::string clipped = take_cols(text, rect.width);
    int x = rect.x + (rect.width - display_cols(clipped)) / 2;
    canvas.draw_text(x, y, clipped, style, rect.x + rect.width);
}

}  // namespace

void LoadingView::render(Canvas& canvas, const LayoutRect& rect, const ShellView& view) {
    using namespace std::chrono;

    auto inner = draw_box_border(canvas, rect, "Loading");
    if (inner.height < 5) return;

    const auto& status = view.import;
    auto elapsed = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    const char* frame = kSpinner[(elapsed / 100) % kSpinnerFrames];

    int y = inner.y + inner.height / 2 - 2;
    draw_centered(canvas, inner, y, std::string(frame) + " Fetching playlist...", styles::kSelected);
    draw_centered(canvas, inner, y + 1, status.request, styles::kDim);

    if (!status.source.empty()) {
        draw_centered(canvas, inner, y + 3, "Source: " + status.source, Style{});
    }
    std::string count = std::to_string(status.fetched) + (status.fetched == 1 ? " video" : " videos") + " fetched";
    draw_centered(canvas, inner, y + 4, count, styles::kAccent);
}

}  // namespace listui::ui::widgets
