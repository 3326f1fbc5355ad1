/// @file main.cpp
/// @brief Analog dial demo: simulated speed shown on one to four dials
///
/// A random walk stands in for a speed sensor and updates a shared value
/// every 0.2 s. Each dial follows it with a spring-animated hand. The
/// arrangement adapts to the window: resize to see one, two or four dials.

#include "demo/speed_simulator.hpp"
#include "demo/value_store.hpp"
#include "dial/dial_config.hpp"
#include "rendering/app_font.hpp"
#include "rendering/dial_renderer.hpp"
#include "rendering/theme.hpp"
#include "ui/dial_layout.hpp"
#include "ui/dial_widget.hpp"

#include <raylib.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int INITIAL_WIDTH = 1024;
constexpr int INITIAL_HEIGHT = 768;
constexpr int MIN_WIDTH = 240;
constexpr int MIN_HEIGHT = 240;
constexpr int TARGET_FPS = 60;
constexpr float HUD_HEIGHT = 28.0f;
constexpr int HUD_FONT = 16;

/// Everything the frame loop mutates
struct AppState {
    std::unique_ptr<analogdial::ValueStore> store;
    std::unique_ptr<analogdial::SpeedSimulator> simulator;
    std::vector<std::unique_ptr<analogdial::DialWidget>> widgets;
    std::vector<analogdial::DialSlot> slots;
    analogdial::SizeClasses classes;
    analogdial::ColorScheme ambient_scheme = analogdial::ColorScheme::LIGHT;
    bool has_layout = false;
};

analogdial::ColorScheme ambient_scheme_from_env() {
    const char* value = std::getenv("ANALOG_DIAL_SCHEME");
    return analogdial::parse_color_scheme(value != nullptr ? value : "");
}

uint32_t seed_from_env() {
    const char* value = std::getenv("ANALOG_DIAL_SEED");
    if (value != nullptr) {
        return static_cast<uint32_t>(std::strtoul(value, nullptr, 10));
    }
    return static_cast<uint32_t>(std::time(nullptr));
}

/// Recomputes dial placement. Widgets are only rebuilt when the size classes
/// change; a plain resize within the same classes just moves the cells.
void relayout(AppState& app) {
    int screen_w = GetScreenWidth();
    int screen_h = GetScreenHeight();
    analogdial::SizeClasses classes = analogdial::classify_window(screen_w, screen_h);
    app.slots = analogdial::compute_dial_layout(screen_w, screen_h, app.ambient_scheme, HUD_HEIGHT);

    if (app.has_layout && classes == app.classes) {
        return;
    }

    app.widgets.clear();
    for (const analogdial::DialSlot& slot : app.slots) {
        app.widgets.push_back(std::make_unique<analogdial::DialWidget>(
            app.store.get(), slot.config, slot.scheme, slot.accent));
    }
    app.classes = classes;
    app.has_layout = true;
    std::fprintf(stderr, "[analog_dial] Layout %s: %zu dial(s) at %dx%d\n",
                 analogdial::size_classes_name(classes), app.widgets.size(), screen_w, screen_h);
}

void draw_hud(const AppState& app) {
    char text[64];
    std::snprintf(text, sizeof(text), "Speed: %.1f%s", app.store->value(),
                  app.simulator->paused() ? "  (paused)" : "");
    analogdial::DrawAppText(text, 16, 8, HUD_FONT, {140, 140, 150, 255});
}

void frame_tick(AppState& app) {
    float dt = GetFrameTime();

    if (IsWindowResized()) {
        relayout(app);
    }
    if (IsKeyPressed(KEY_SPACE)) {
        app.simulator->set_paused(!app.simulator->paused());
    }

    // --- Update: the value first, so hands retarget within the same frame ---
    app.simulator->tick(dt);
    for (auto& widget : app.widgets) {
        widget->update(dt);
    }

    // --- Draw ---
    BeginDrawing();
    ClearBackground({128, 128, 134, 255});

    for (size_t i = 0; i < app.widgets.size() && i < app.slots.size(); i++) {
        analogdial::draw_scene(app.widgets[i]->compose(app.slots[i].area));
    }
    draw_hud(app);

    EndDrawing();
}

} // namespace

int main() {
    SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "Analog Dial");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetTargetFPS(TARGET_FPS);
    analogdial::init_app_font();

    AppState app;
    app.ambient_scheme = ambient_scheme_from_env();
    app.store = std::make_unique<analogdial::ValueStore>(0.0);
    uint32_t seed = seed_from_env();
    app.simulator = std::make_unique<analogdial::SpeedSimulator>(app.store.get(), seed);
    std::fprintf(stderr, "[analog_dial] Ambient scheme %s, simulator seed %u\n",
                 analogdial::color_scheme_name(app.ambient_scheme), seed);

    int status = 0;
    try {
        relayout(app);
        while (!WindowShouldClose()) {
            frame_tick(app);
        }
    } catch (const analogdial::InvalidConfiguration& e) {
        std::fprintf(stderr, "[analog_dial] Invalid dial configuration: %s\n", e.what());
        status = 1;
    }

    // Widgets unsubscribe from the store, so they go first
    app.widgets.clear();
    analogdial::cleanup_app_font();
    CloseWindow();
    return status;
}
