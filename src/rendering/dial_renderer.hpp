/// @file dial_renderer.hpp
/// @brief Rasterizes composed dial scenes with Raylib

#pragma once

#include "rendering/scene_composer.hpp"

#include <raylib.h>

namespace analogdial {

/// Draws every element of @p scene in order, later elements on top.
/// Must be called between BeginDrawing() and EndDrawing().
void draw_scene(const Scene& scene);

/// Conversions from the toolkit-independent scene types
Color to_raylib(Rgba color);
Vector2 to_raylib(Vec2 point);

} // namespace analogdial
