/// @file dial_layout.cpp
/// @brief Size-class driven placement of the demo dials

#include "ui/dial_layout.hpp"

#include <algorithm>

namespace analogdial {

namespace {

DialConfig speed_dial() {
    DialConfig c;
    c.max_value = 60.0;
    c.major_step = 10.0;
    return c;
}

DialConfig fine_speed_dial() {
    DialConfig c;
    c.max_value = 40.0;
    c.major_step = 5.0;
    c.subdivisions = 5;
    return c;
}

/// Quarter-circle sweep across the top-right
DialConfig narrow_sweep_dial() {
    DialConfig c;
    c.max_value = 60.0;
    c.major_step = 20.0;
    c.subdivisions = 10;
    c.start_angle = -45.0;
    c.end_angle = 45.0;
    return c;
}

/// Upper half circle, west to east
DialConfig half_circle_dial() {
    DialConfig c;
    c.max_value = 50.0;
    c.major_step = 10.0;
    c.subdivisions = 10;
    c.start_angle = -180.0;
    c.end_angle = 0.0;
    return c;
}

/// Splits @p area into @p count equal cells along one axis
std::vector<Rect> split(const Rect& area, int count, bool horizontal, float spacing) {
    std::vector<Rect> cells;
    double gap = static_cast<double>(spacing) * (count - 1);
    if (horizontal) {
        double w = std::max(0.0, (area.w - gap) / count);
        for (int i = 0; i < count; i++) {
            cells.push_back({area.x + i * (w + spacing), area.y, w, area.h});
        }
    } else {
        double h = std::max(0.0, (area.h - gap) / count);
        for (int i = 0; i < count; i++) {
            cells.push_back({area.x, area.y + i * (h + spacing), area.w, h});
        }
    }
    return cells;
}

} // namespace

SizeClasses classify_window(int screen_w, int screen_h, const LayoutMetrics& metrics) {
    SizeClasses classes;
    classes.horizontal = static_cast<float>(screen_w) >= metrics.regular_min_width
                             ? SizeClass::REGULAR
                             : SizeClass::COMPACT;
    classes.vertical = static_cast<float>(screen_h) >= metrics.regular_min_height
                           ? SizeClass::REGULAR
                           : SizeClass::COMPACT;
    return classes;
}

const char* size_classes_name(const SizeClasses& classes) {
    bool wide = classes.horizontal == SizeClass::REGULAR;
    bool tall = classes.vertical == SizeClass::REGULAR;
    if (wide && tall) {
        return "regular/regular";
    }
    if (wide) {
        return "regular/compact";
    }
    if (tall) {
        return "compact/regular";
    }
    return "compact/compact";
}

std::vector<DialSlot> compute_dial_layout(int screen_w, int screen_h, ColorScheme ambient_scheme,
                                          float top_inset, const LayoutMetrics& metrics) {
    const double pad = metrics.padding;
    Rect content = {pad, pad + top_inset, std::max(0.0, screen_w - 2.0 * pad),
                    std::max(0.0, screen_h - 2.0 * pad - top_inset)};

    const SizeClasses classes = classify_window(screen_w, screen_h, metrics);
    const bool wide = classes.horizontal == SizeClass::REGULAR;
    const bool tall = classes.vertical == SizeClass::REGULAR;

    std::vector<DialSlot> slots;

    if (wide && tall) {
        std::vector<Rect> rows = split(content, 2, false, metrics.spacing);
        std::vector<Rect> top = split(rows[0], 2, true, metrics.spacing);
        std::vector<Rect> bottom = split(rows[1], 2, true, metrics.spacing);
        slots.push_back({top[0], speed_dial(), ColorScheme::LIGHT, colors::RED});
        slots.push_back({top[1], fine_speed_dial(), ColorScheme::DARK, colors::ORANGE});
        slots.push_back({bottom[0], narrow_sweep_dial(), ColorScheme::DARK, colors::YELLOW});
        slots.push_back({bottom[1], half_circle_dial(), ColorScheme::LIGHT, colors::BLUE});
    } else if (wide || tall) {
        // Side by side in wide-and-short windows, stacked in narrow-and-tall ones
        std::vector<Rect> cells = split(content, 2, wide, metrics.spacing);
        slots.push_back({cells[0], speed_dial(), ColorScheme::LIGHT, colors::RED});
        slots.push_back({cells[1], fine_speed_dial(), ColorScheme::DARK, colors::ORANGE});
    } else {
        slots.push_back({content, speed_dial(), ambient_scheme, colors::RED});
    }

    return slots;
}

} // namespace analogdial
