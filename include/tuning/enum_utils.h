#pragma once

#include <cctype>
#include <magic_enum/magic_enum.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// String conversion for the engine's enums (strategy kinds, correlation,
// search states) built on magic_enum. Config files use snake_case, console
// output uses the PascalCase enumerator names.

namespace enum_utils {

// "CrossingPointSplit" -> "crossing_point_split"
inline std::string toSnakeCase(std::string_view pascal) {
    std::string result;
    result.reserve(pascal.size() + 4);

    for (size_t i = 0; i < pascal.size(); ++i) {
        char c = pascal[i];
        if (std::isupper(static_cast<unsigned char>(c))) {
            if (i > 0) {
                result += '_';
            }
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            result += c;
        }
    }
    return result;
}

// "poly_fit" -> "PolyFit"
inline std::string toPascalCase(std::string_view snake) {
    std::string result;
    result.reserve(snake.size());

    bool capitalize_next = true;
    for (char c : snake) {
        if (c == '_' || c == '-') {
            capitalize_next = true;
        } else if (capitalize_next) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            capitalize_next = false;
        } else {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

// snake_case, as written in config files
template <typename E>
std::string toString(E value) {
    return toSnakeCase(magic_enum::enum_name(value));
}

// PascalCase, as printed on the console
template <typename E>
std::string toDisplayString(E value) {
    return std::string(magic_enum::enum_name(value));
}

// Accepts "LinFit", "linfit", "lin_fit" or "lin-fit"
template <typename E>
std::optional<E> fromString(std::string_view str) {
    auto direct = magic_enum::enum_cast<E>(str, magic_enum::case_insensitive);
    if (direct.has_value()) {
        return direct;
    }
    return magic_enum::enum_cast<E>(toPascalCase(str));
}

// "percent_scale | mesh_step | ..." for error messages
template <typename E>
std::string joinedNames(std::string_view separator = " | ") {
    std::string result;
    for (auto value : magic_enum::enum_values<E>()) {
        if (!result.empty()) {
            result += separator;
        }
        result += toString(value);
    }
    return result;
}

} // namespace enum_utils
