/// @file test_scene_composer.cpp
/// @brief Tests for element order, geometry and colors of composed dial scenes

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "dial/dial.hpp"
#include "rendering/scene_composer.hpp"
#include "rendering/theme.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

using namespace analogdial;
using Catch::Approx;

namespace {

constexpr double PI = 3.14159265358979323846;

Dial speed_dial() {
    DialConfig config;
    config.max_value = 60.0;
    config.major_step = 10.0;
    return Dial(config);
}

template <typename T>
std::vector<T> elements_of(const Scene& scene) {
    std::vector<T> out;
    for (const SceneElement& element : scene.elements) {
        if (const T* e = std::get_if<T>(&element)) {
            out.push_back(*e);
        }
    }
    return out;
}

const Hand& hand_of(const Scene& scene) {
    return std::get<Hand>(scene.elements.back());
}

} // namespace

TEST_CASE("Scene elements are in paint order", "[scene]") {
    Dial dial{DialConfig{}};
    Scene scene =
        compose_scene(dial, 50.0, theme_for(ColorScheme::LIGHT), colors::RED, {0, 0, 200, 200});

    // disc, ring, 15 minor ticks, 6 major ticks each with a label, hand
    REQUIRE(scene.elements.size() == 2 + 15 + 6 * 2 + 1);
    CHECK(std::holds_alternative<BackgroundDisc>(scene.elements[0]));
    CHECK(std::holds_alternative<BackgroundRing>(scene.elements[1]));
    for (std::size_t i = 2; i < 17; i++) {
        REQUIRE(std::holds_alternative<TickMark>(scene.elements[i]));
        CHECK(std::get<TickMark>(scene.elements[i]).style == TickStyle::MINOR);
    }
    for (std::size_t i = 17; i < 29; i += 2) {
        REQUIRE(std::holds_alternative<TickMark>(scene.elements[i]));
        CHECK(std::get<TickMark>(scene.elements[i]).style == TickStyle::MAJOR);
        CHECK(std::holds_alternative<TickLabel>(scene.elements[i + 1]));
    }
    CHECK(std::holds_alternative<Hand>(scene.elements.back()));
}

TEST_CASE("Dial is fitted as a centered square", "[scene]") {
    Dial dial = speed_dial();
    Scene scene =
        compose_scene(dial, 0.0, theme_for(ColorScheme::LIGHT), colors::RED, {0, 0, 400, 200});

    CHECK(scene.bounds.x == 100.0);
    CHECK(scene.bounds.y == 0.0);
    CHECK(scene.bounds.w == 200.0);
    CHECK(scene.bounds.h == 200.0);

    auto disc = std::get<BackgroundDisc>(scene.elements[0]);
    CHECK(disc.center.x == 200.0);
    CHECK(disc.center.y == 100.0);
    CHECK(disc.radius == 100.0);
}

TEST_CASE("Tick marks sit on the rim at their value's angle", "[scene]") {
    Dial dial = speed_dial();
    Scene scene =
        compose_scene(dial, 0.0, theme_for(ColorScheme::LIGHT), colors::RED, {0, 0, 200, 200});

    std::vector<TickMark> ticks = elements_of<TickMark>(scene);
    REQUIRE(ticks.size() == 7);

    const TickMark& zero = ticks.front();
    CHECK(zero.style == TickStyle::MAJOR);
    CHECK(zero.value == 0.0);
    CHECK(zero.angle == -225.0);
    CHECK(zero.length == Approx(12.0));
    CHECK(zero.thickness == Approx(2.4));

    // Inset by half the mark's length: outer end touches the rim
    double inset = 100.0 - 6.0;
    CHECK(zero.center.x == Approx(100.0 + inset * std::cos(-225.0 * PI / 180.0)));
    CHECK(zero.center.y == Approx(100.0 + inset * std::sin(-225.0 * PI / 180.0)));

    for (const TickMark& tick : ticks) {
        double dx = tick.center.x - 100.0;
        double dy = tick.center.y - 100.0;
        CHECK(std::hypot(dx, dy) == Approx(inset));
        CHECK(tick.angle == Approx(dial.angle_for(tick.value)));
    }
}

TEST_CASE("Minor tick marks are smaller than major ones", "[scene]") {
    Dial dial{DialConfig{}};
    Scene scene =
        compose_scene(dial, 0.0, theme_for(ColorScheme::LIGHT), colors::RED, {0, 0, 500, 500});

    for (const TickMark& tick : elements_of<TickMark>(scene)) {
        if (tick.style == TickStyle::MINOR) {
            CHECK(tick.length == Approx(20.0));
            CHECK(tick.thickness == Approx(3.5));
            double r = std::hypot(tick.center.x - 250.0, tick.center.y - 250.0);
            CHECK(r == Approx(250.0 - 10.0));
        }
    }
}

TEST_CASE("Labels are rounded integers at three quarters of the radius", "[scene]") {
    DialConfig config;
    config.max_value = 40.0;
    config.major_step = 5.0;
    config.subdivisions = 5;
    Dial dial(config);

    Scene scene =
        compose_scene(dial, 0.0, theme_for(ColorScheme::DARK), colors::ORANGE, {0, 0, 280, 280});
    std::vector<TickLabel> labels = elements_of<TickLabel>(scene);

    REQUIRE(labels.size() == 9);
    for (std::size_t i = 0; i < labels.size(); i++) {
        const TickLabel& label = labels[i];
        CHECK(label.text == std::to_string(i * 5));
        CHECK(label.font_size == Approx(20.0));
        CHECK(label.color == colors::WHITE);
        CHECK(std::hypot(label.center.x - 140.0, label.center.y - 140.0) == Approx(105.0));
    }

    // Midpoint label straight up from the center
    CHECK(labels[4].center.x == Approx(140.0));
    CHECK(labels[4].center.y == Approx(35.0));
}

TEST_CASE("Hand follows the value and carries the accent", "[scene]") {
    Dial dial = speed_dial();
    Scene scene =
        compose_scene(dial, 30.0, theme_for(ColorScheme::LIGHT), colors::BLUE, {0, 0, 200, 200});

    const Hand& hand = hand_of(scene);
    CHECK(hand.angle == -90.0);
    CHECK(hand.pivot.x == 100.0);
    CHECK(hand.pivot.y == 100.0);
    CHECK(hand.length == Approx(90.0));
    CHECK(hand.thickness == Approx(2.0));
    CHECK(hand.pivot_fraction == Approx(0.1));
    CHECK(hand.knob_radius == Approx(6.0));
    CHECK(hand.color == colors::BLUE);
}

TEST_CASE("Animated hand angle is independent of the reported value", "[scene]") {
    Dial dial = speed_dial();
    Scene scene = compose_scene(dial, 30.0, -150.0, theme_for(ColorScheme::LIGHT), colors::RED,
                                {0, 0, 200, 200});

    CHECK(hand_of(scene).angle == -150.0);
    CHECK(scene.accessibility.value == "30");
}

TEST_CASE("Values past the scale still compose", "[scene]") {
    Dial dial = speed_dial();
    Scene scene =
        compose_scene(dial, 75.0, theme_for(ColorScheme::LIGHT), colors::RED, {0, 0, 200, 200});

    CHECK(hand_of(scene).angle == Approx(112.5));
    CHECK(hand_of(scene).angle > dial.config().end_angle);

    Scene below =
        compose_scene(dial, -20.0, theme_for(ColorScheme::LIGHT), colors::RED, {0, 0, 200, 200});
    CHECK(hand_of(below).angle < dial.config().start_angle);
}

TEST_CASE("Face colors come from the theme", "[scene]") {
    Dial dial = speed_dial();

    Scene light =
        compose_scene(dial, 0.0, theme_for(ColorScheme::LIGHT), colors::RED, {0, 0, 100, 100});
    CHECK(std::get<BackgroundDisc>(light.elements[0]).color == colors::WHITE);
    CHECK(std::get<BackgroundRing>(light.elements[1]).color == colors::BLACK);
    for (const TickMark& tick : elements_of<TickMark>(light)) {
        CHECK(tick.color == colors::BLACK);
    }

    Scene dark =
        compose_scene(dial, 0.0, theme_for(ColorScheme::DARK), colors::RED, {0, 0, 100, 100});
    CHECK(std::get<BackgroundDisc>(dark.elements[0]).color == colors::BLACK);
    CHECK(std::get<BackgroundRing>(dark.elements[1]).color.is_transparent());
    for (const TickMark& tick : elements_of<TickMark>(dark)) {
        CHECK(tick.color == colors::WHITE);
    }
}

TEST_CASE("Accessibility summary is supplied every frame", "[scene]") {
    Dial dial = speed_dial();
    Scene scene =
        compose_scene(dial, 12.5, theme_for(ColorScheme::LIGHT), colors::RED, {0, 0, 100, 100});

    CHECK(scene.accessibility.label == "Dial");
    CHECK(scene.accessibility.value == "12.5");
    CHECK(scene.accessibility.is_summary_element);
    CHECK(scene.accessibility.updates_frequently);
}

TEST_CASE("Accessibility value keeps every significant digit", "[scene]") {
    CHECK(format_accessibility_value(23.456789123) == "23.456789123");
    CHECK(format_accessibility_value(1234567.0) == "1234567");
    CHECK(format_accessibility_value(-0.5) == "-0.5");
    CHECK(format_accessibility_value(0.1) == "0.1");

    Dial dial{DialConfig{}};
    Scene scene = compose_scene(dial, 23.456789123, theme_for(ColorScheme::LIGHT), colors::RED,
                                {0, 0, 100, 100});
    CHECK(scene.accessibility.value == "23.456789123");
}

TEST_CASE("Composition is repeatable", "[scene]") {
    Dial dial{DialConfig{}};
    Theme theme = theme_for(ColorScheme::LIGHT);
    Scene a = compose_scene(dial, 42.0, theme, colors::RED, {0, 0, 300, 300});
    Scene b = compose_scene(dial, 42.0, theme, colors::RED, {0, 0, 300, 300});

    REQUIRE(a.elements.size() == b.elements.size());
    std::vector<TickMark> ta = elements_of<TickMark>(a);
    std::vector<TickMark> tb = elements_of<TickMark>(b);
    for (std::size_t i = 0; i < ta.size(); i++) {
        CHECK(ta[i].center.x == tb[i].center.x);
        CHECK(ta[i].center.y == tb[i].center.y);
    }
    CHECK(hand_of(a).angle == hand_of(b).angle);
}

TEST_CASE("Tick label formatting", "[scene]") {
    CHECK(format_tick_label(40.0) == "40");
    CHECK(format_tick_label(12.6) == "13");
    CHECK(format_tick_label(-7.0) == "-7");
    CHECK(format_tick_label(-0.3) == "0");
    CHECK(format_tick_label(0.0) == "0");
}
