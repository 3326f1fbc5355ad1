/// @file dial_renderer.cpp
/// @brief Draws discs, rings, rotated tick rectangles, labels and the hand

#include "rendering/dial_renderer.hpp"

#include "rendering/app_font.hpp"

#include <algorithm>
#include <variant>

namespace analogdial {

namespace {

constexpr float RING_STROKE = 1.0f;
constexpr int CIRCLE_SEGMENTS = 96;

/// Rectangle centered on `center`, long side along `angle`
void draw_rotated_bar(Vec2 center, double length, double thickness, double angle, Color color) {
    auto w = static_cast<float>(length);
    auto h = static_cast<float>(thickness);
    Rectangle rec = {static_cast<float>(center.x), static_cast<float>(center.y), w, h};
    // Raylib rotates clockwise in screen space, matching the scene's convention
    DrawRectanglePro(rec, {w / 2.0f, h / 2.0f}, static_cast<float>(angle), color);
}

void draw_element(const BackgroundDisc& disc) {
    DrawCircleV(to_raylib(disc.center), static_cast<float>(disc.radius), to_raylib(disc.color));
}

void draw_element(const BackgroundRing& ring) {
    if (ring.color.is_transparent()) {
        return;
    }
    auto outer = static_cast<float>(ring.radius);
    DrawRing(to_raylib(ring.center), std::max(0.0f, outer - RING_STROKE), outer, 0.0f, 360.0f,
             CIRCLE_SEGMENTS, to_raylib(ring.color));
}

void draw_element(const TickMark& tick) {
    draw_rotated_bar(tick.center, tick.length, tick.thickness, tick.angle, to_raylib(tick.color));
}

void draw_element(const TickLabel& label) {
    DrawAppTextCentered(label.text.c_str(), to_raylib(label.center),
                        static_cast<float>(label.font_size), to_raylib(label.color));
}

void draw_element(const Hand& hand) {
    Color color = to_raylib(hand.color);
    auto w = static_cast<float>(hand.length);
    auto h = static_cast<float>(hand.thickness);
    Rectangle rec = {static_cast<float>(hand.pivot.x), static_cast<float>(hand.pivot.y), w, h};
    // Origin sits on the pivot: a short tail behind it, the long end pointing out
    Vector2 origin = {w * static_cast<float>(hand.pivot_fraction), h / 2.0f};
    DrawCircleV(to_raylib(hand.pivot), static_cast<float>(hand.knob_radius), color);
    DrawRectanglePro(rec, origin, static_cast<float>(hand.angle), color);
}

} // namespace

Color to_raylib(Rgba color) {
    return {color.r, color.g, color.b, color.a};
}

Vector2 to_raylib(Vec2 point) {
    return {static_cast<float>(point.x), static_cast<float>(point.y)};
}

void draw_scene(const Scene& scene) {
    for (const SceneElement& element : scene.elements) {
        std::visit([](const auto& e) { draw_element(e); }, element);
    }
}

} // namespace analogdial
