/// @file app_font.cpp
/// @brief Loads and manages the label font.

#include "rendering/app_font.hpp"

#include <cstdio>
#include <cstdlib>

namespace analogdial {

namespace {

/// Sentinel: if true we own the font and must unload it.
bool g_font_loaded = false;

/// The loaded font handle (or default).
Font g_font = {};

/// Spacing scaled proportionally: Raylib's default is fontSize / 10.
float spacing_for(float fontSize) {
    return fontSize / 10.0f;
}

/// Attempts to load a TTF from `path`. Returns true on success.
bool try_load(const char* path) {
    if (path == nullptr || !FileExists(path)) {
        return false;
    }
    // Labels scale with the window (roughly 10-80 px), so rasterize large and
    // let bilinear filtering shrink it. Digits and ASCII are all we draw.
    g_font = LoadFontEx(path, 96, nullptr, 128);
    if (g_font.glyphCount <= 0) {
        return false;
    }
    SetTextureFilter(g_font.texture, TEXTURE_FILTER_BILINEAR);
    std::fprintf(stderr, "[analog_dial] Loaded label font %s\n", path);
    return true;
}

} // namespace

void init_app_font() {
    const char* candidates[] = {
        std::getenv("ANALOG_DIAL_FONT"),
        "resources/fonts/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
    };
    for (const char* path : candidates) {
        if (try_load(path)) {
            g_font_loaded = true;
            return;
        }
    }
    g_font = GetFontDefault();
    g_font_loaded = false;
    std::fprintf(stderr, "[analog_dial] Label font not found, using Raylib default.\n");
}

void cleanup_app_font() {
    if (g_font_loaded) {
        UnloadFont(g_font);
        g_font_loaded = false;
    }
}

void DrawAppTextCentered(const char* text, Vector2 center, float fontSize, Color color) {
    float spacing = spacing_for(fontSize);
    Vector2 size = MeasureTextEx(g_font, text, fontSize, spacing);
    DrawTextEx(g_font, text, {center.x - size.x / 2.0f, center.y - size.y / 2.0f}, fontSize,
               spacing, color);
}

void DrawAppText(const char* text, int posX, int posY, int fontSize, Color color) {
    auto size = static_cast<float>(fontSize);
    DrawTextEx(g_font, text, {static_cast<float>(posX), static_cast<float>(posY)}, size,
               spacing_for(size), color);
}

} // namespace analogdial
