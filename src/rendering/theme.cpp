/// @file theme.cpp
/// @brief Scheme-dependent palette selection

#include "rendering/theme.hpp"

#include <cctype>
#include <cstddef>

namespace analogdial {

namespace {

bool equals_ignore_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

Theme theme_for(ColorScheme scheme) {
    switch (scheme) {
    case ColorScheme::LIGHT:
        return {colors::WHITE, colors::BLACK, colors::BLACK, colors::BLACK};
    case ColorScheme::DARK:
        return {colors::BLACK, colors::CLEAR, colors::WHITE, colors::WHITE};
    }
    return {colors::WHITE, colors::BLACK, colors::BLACK, colors::BLACK};
}

ColorScheme parse_color_scheme(std::string_view text) {
    if (equals_ignore_case(trim(text), "dark")) {
        return ColorScheme::DARK;
    }
    return ColorScheme::LIGHT;
}

const char* color_scheme_name(ColorScheme scheme) {
    switch (scheme) {
    case ColorScheme::LIGHT:
        return "light";
    case ColorScheme::DARK:
        return "dark";
    }
    return "light";
}

} // namespace analogdial
