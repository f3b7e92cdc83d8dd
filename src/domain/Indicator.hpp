/**
 * @file Indicator.hpp
 * @brief Value Object describing one indicator of the controlled vocabulary.
 */

#pragma once

#include <optional>
#include <string>

namespace indexforge::domain {

/**
 * @enum Direction
 * @brief Whether higher raw values are good (Positive) or bad (Negative).
 */
enum class Direction {
    Positive,
    Negative
};

inline std::string DirectionToString(Direction d) {
    return d == Direction::Negative ? "negative" : "positive";
}

inline std::optional<Direction> DirectionFromString(const std::string& s) {
    if (s == "positive") return Direction::Positive;
    if (s == "negative") return Direction::Negative;
    return std::nullopt;
}

/// Dimension used when an indicator declares no second-level grouping.
inline const char* const kDefaultDimension = "default";

/**
 * @struct Indicator
 * @brief Catalog entry: key, display name, sub-index grouping and direction.
 */
struct Indicator {
    std::string key;              ///< Unique indicator key.
    std::string name;             ///< Human readable label.
    std::string dimension2Key;    ///< Second-level grouping (sub-index).
    Direction direction = Direction::Positive;
    std::optional<std::string> unit;

    /** @brief Grouping key with the empty string mapped to "default". */
    std::string effectiveDimension() const {
        return dimension2Key.empty() ? std::string(kDefaultDimension) : dimension2Key;
    }
};

} // namespace indexforge::domain
