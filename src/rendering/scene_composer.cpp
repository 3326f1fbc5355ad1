/// @file scene_composer.cpp
/// @brief Builds the paint-ordered element list for one dial frame

#include "rendering/scene_composer.hpp"

#include <charconv>
#include <cstdio>
#include <cstring>
#include <utility>

namespace analogdial {

namespace {

/// Mark placed at the rim, pulled inward by half its length so its outer
/// end touches the circle
TickMark make_tick(TickStyle style, double value, double angle, Vec2 center, double diameter,
                   Rgba color) {
    bool major = style == TickStyle::MAJOR;
    double length = diameter * (major ? DialProportions::MAJOR_TICK_LENGTH
                                      : DialProportions::MINOR_TICK_LENGTH);
    double thickness = diameter * (major ? DialProportions::MAJOR_TICK_THICKNESS
                                         : DialProportions::MINOR_TICK_THICKNESS);
    double inset_radius = diameter / 2.0 - length / 2.0;

    TickMark tick;
    tick.style = style;
    tick.value = value;
    tick.center = place_polar(center, {inset_radius, angle});
    tick.length = length;
    tick.thickness = thickness;
    tick.angle = angle;
    tick.color = color;
    return tick;
}

} // namespace

std::string format_tick_label(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.0f", value);
    if (std::strcmp(buf, "-0") == 0) {
        return "0";
    }
    return buf;
}

std::string format_accessibility_value(double value) {
    // Shortest form that parses back to the same double
    char buf[64];
    auto result = std::to_chars(buf, buf + sizeof(buf), value);
    return std::string(buf, result.ptr);
}

Scene compose_scene(const Dial& dial, double current_value, double hand_angle,
                    const Theme& theme, Rgba accent, const Rect& area) {
    Scene scene;
    scene.bounds = fit_square(area);
    scene.accessibility.value = format_accessibility_value(current_value);

    const double diameter = scene.bounds.w;
    const Vec2 center = rect_center(scene.bounds);
    const TickSet& ticks = dial.ticks();

    scene.elements.reserve(2 + ticks.minor_ticks.size() + 2 * ticks.major_ticks.size() + 1);

    // 1-2. Face
    scene.elements.emplace_back(BackgroundDisc{center, diameter / 2.0, theme.background});
    scene.elements.emplace_back(BackgroundRing{center, diameter / 2.0, theme.border});

    // 3. Minor ticks underneath the majors
    for (double value : ticks.minor_ticks) {
        scene.elements.emplace_back(make_tick(TickStyle::MINOR, value, dial.angle_for(value),
                                              center, diameter, theme.tick));
    }

    // 4. Major ticks, each followed by its label
    const double label_radius = diameter * DialProportions::LABEL_RADIUS;
    const double font_size = diameter / DialProportions::LABEL_FONT_DIVISOR;
    for (double value : ticks.major_ticks) {
        double angle = dial.angle_for(value);
        scene.elements.emplace_back(
            make_tick(TickStyle::MAJOR, value, angle, center, diameter, theme.tick));

        TickLabel label;
        label.text = format_tick_label(value);
        label.center = place_polar(center, {label_radius, angle});
        label.font_size = font_size;
        label.color = theme.text;
        scene.elements.emplace_back(std::move(label));
    }

    // 5. Hand on top
    Hand hand;
    hand.pivot = center;
    hand.length = diameter * DialProportions::HAND_LENGTH;
    hand.thickness = diameter * DialProportions::HAND_THICKNESS;
    hand.pivot_fraction = DialProportions::HAND_PIVOT_FRACTION;
    hand.angle = hand_angle;
    hand.knob_radius = diameter * DialProportions::KNOB_RADIUS;
    hand.color = accent;
    scene.elements.emplace_back(hand);

    return scene;
}

Scene compose_scene(const Dial& dial, double current_value, const Theme& theme, Rgba accent,
                    const Rect& area) {
    return compose_scene(dial, current_value, dial.angle_for(current_value), theme, accent, area);
}

} // namespace analogdial
