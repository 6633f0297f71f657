#include "debug.hpp"
#include "../debug_panel.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <string>

namespace {

constexpr int   kPad        = 8;
constexpr int   kPanelW     = 250;
constexpr int   kRowH       = 15;
constexpr int   kSectionGap = 4;
constexpr int   kFontSm     = 10;
constexpr int   kFontMd     = 11;
constexpr int   kLabelW     = 120;  // content-left to value column
constexpr int   kMargin     = 10;
constexpr Color kBg         = {20,  20,  20,  210};
constexpr Color kDivider    = {80,  80,  80,  200};
constexpr Color kTitle      = {160, 160, 160, 255};
constexpr Color kHeader     = {210, 190, 80,  255};
constexpr Color kLabel      = {180, 180, 180, 255};
constexpr Color kValue      = {255, 255, 255, 255};

int panel_height(const DebugPanel& panel) {
    const int sections = static_cast<int>(panel.sections().size());
    const int lines    = static_cast<int>(panel.row_count()) + sections;  // rows + headers
    return kPad + (kRowH + kPad) + lines * kRowH + sections * kSectionGap + kPad;
}

// Draws one section at y and returns the y below it.
int draw_section(const DebugPanel::Section& sec, int x, int y) {
    DrawLine(x + kPad, y, x + kPanelW - kPad, y, kDivider);
    y += kSectionGap;
    DrawText(sec.title.c_str(), x + kPad, y, kFontMd, kHeader);
    y += kRowH;

    for (const auto& row : sec.rows) {
        const std::string val = row.fn();
        DrawText(row.label.c_str(), x + kPad + 4,           y, kFontSm, kLabel);
        DrawText(val.c_str(),       x + kPad + 4 + kLabelW, y, kFontSm, kValue);
        y += kRowH;
    }
    return y;
}

} // namespace

void DebugSystem::Update(ecs::World& world, float /*dt*/) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    auto* input = world.try_resource<InputRecord>();
    if (input && input->keys_pressed[KEY_F3]) panel->toggle();
    if (!panel->visible) return;

    // Anchored top right, clear of the HUD text.
    const int x = GetScreenWidth() - kPanelW - kMargin;
    const int y = kMargin;
    const int h = panel_height(*panel);

    DrawRectangle(x, y, kPanelW, h, kBg);
    DrawRectangleLines(x, y, kPanelW, h, kDivider);

    int cy = y + kPad;
    DrawText("DEBUG", x + kPad, cy, kFontMd, kTitle);
    DrawText("[F3]", x + kPanelW - kPad - MeasureText("[F3]", kFontSm) - 2, cy + 1, kFontSm, kDivider);
    cy += kRowH + kPad;

    for (const auto& sec : panel->sections()) cy = draw_section(sec, x, cy);
}
