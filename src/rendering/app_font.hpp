/// @file app_font.hpp
/// @brief Font used for dial labels and the HUD.
///
/// Loads a TTF once at startup and wraps Raylib's text helpers so every call
/// site draws with the same typeface without passing a Font handle around.

#pragma once

#include <raylib.h>

namespace analogdial {

/// Load the label font. Must be called *after* InitWindow().
/// Tries, in order:
///   1. the path in ANALOG_DIAL_FONT, if set
///   2. resources/fonts/DejaVuSans-Bold.ttf (relative to the working directory)
///   3. /usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf
/// If all fail, the Raylib default bitmap font is used.
void init_app_font();

/// Unload the font (safe to call even if init failed).
/// Should be called before CloseWindow().
void cleanup_app_font();

/// Draws @p text with its bounding box centered on @p center.
void DrawAppTextCentered(const char* text, Vector2 center, float fontSize, Color color);

/// Draws text at integer (x, y), mirroring Raylib's DrawText().
void DrawAppText(const char* text, int posX, int posY, int fontSize, Color color);

} // namespace analogdial
