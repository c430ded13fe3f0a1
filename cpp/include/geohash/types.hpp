#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace geohash {

// Valid coordinate ranges (degrees)
constexpr double LON_MIN = -180.0;
constexpr double LON_MAX = 180.0;
constexpr double LAT_MIN = -90.0;
constexpr double LAT_MAX = 90.0;

// Longitude/latitude pair: x = longitude, y = latitude
struct Coordinate {
    double x, y;

    constexpr Coordinate() noexcept : x(0.0), y(0.0) {}
    constexpr Coordinate(double x_, double y_) noexcept : x(x_), y(y_) {}

    // True when both components lie inside the valid ranges.
    // The codec does not call this; callers pre-validate untrusted input.
    constexpr bool is_valid() const noexcept {
        return x >= LON_MIN && x <= LON_MAX && y >= LAT_MIN && y <= LAT_MAX;
    }
};

constexpr bool operator==(const Coordinate& lhs, const Coordinate& rhs) noexcept {
    return lhs.x == rhs.x && lhs.y == rhs.y;
}

constexpr bool operator!=(const Coordinate& lhs, const Coordinate& rhs) noexcept {
    return !(lhs == rhs);
}

/**
 * Rectangle of (longitude, latitude) values denoted by a geohash.
 * min holds the lower-left corner, max the upper-right corner.
 */
struct BoundingBox {
    Coordinate min;
    Coordinate max;

    constexpr BoundingBox() noexcept : min(), max() {}
    constexpr BoundingBox(Coordinate min_, Coordinate max_) noexcept : min(min_), max(max_) {}

    constexpr Coordinate center() const noexcept {
        return Coordinate((min.x + max.x) / 2.0, (min.y + max.y) / 2.0);
    }
    constexpr double width() const noexcept { return max.x - min.x; }
    constexpr double height() const noexcept { return max.y - min.y; }

    constexpr bool contains(const Coordinate& c, double tolerance = 0.0) const noexcept {
        return c.x >= min.x - tolerance && c.x <= max.x + tolerance &&
               c.y >= min.y - tolerance && c.y <= max.y + tolerance;
    }

    constexpr bool contains(const BoundingBox& other) const noexcept {
        return other.min.x >= min.x && other.max.x <= max.x &&
               other.min.y >= min.y && other.max.y <= max.y;
    }
};

constexpr bool operator==(const BoundingBox& lhs, const BoundingBox& rhs) noexcept {
    return lhs.min == rhs.min && lhs.max == rhs.max;
}

constexpr bool operator!=(const BoundingBox& lhs, const BoundingBox& rhs) noexcept {
    return !(lhs == rhs);
}

/**
 * Result of decoding a geohash: the cell center plus half the cell
 * width (lon_error) and half the cell height (lat_error).
 */
struct DecodedCoordinate {
    Coordinate center;
    double lon_error;
    double lat_error;

    constexpr DecodedCoordinate() noexcept : center(), lon_error(0.0), lat_error(0.0) {}
    constexpr DecodedCoordinate(Coordinate c, double lon_err, double lat_err) noexcept
        : center(c), lon_error(lon_err), lat_error(lat_err) {}
};

// Compass directions for neighbor lookup
enum class Direction : uint8_t {
    N = 0,
    NE,
    E,
    SE,
    S,
    SW,
    W,
    NW
};

constexpr size_t DIRECTION_COUNT = 8;

constexpr std::array<Direction, DIRECTION_COUNT> ALL_DIRECTIONS = {
    Direction::N, Direction::NE, Direction::E, Direction::SE,
    Direction::S, Direction::SW, Direction::W, Direction::NW
};

// Signed unit step per axis, each in {-1, 0, 1}
struct DirectionOffset {
    int lat;
    int lon;
};

constexpr DirectionOffset direction_offset(Direction d) noexcept {
    constexpr DirectionOffset table[DIRECTION_COUNT] = {
        { 1,  0},   // N
        { 1,  1},   // NE
        { 0,  1},   // E
        {-1,  1},   // SE
        {-1,  0},   // S
        {-1, -1},   // SW
        { 0, -1},   // W
        { 1, -1},   // NW
    };
    return table[static_cast<size_t>(d)];
}

/**
 * Short lowercase name of a direction ("n", "ne", ...)
 */
const char* direction_name(Direction d) noexcept;

/**
 * Parse a direction name. Accepts short ("ne") and long ("north-east",
 * "northeast", "north_east") forms, case-insensitive.
 * @return std::nullopt if the name is not recognised
 */
std::optional<Direction> parse_direction(std::string_view name);

/**
 * The eight geohashes surrounding a cell, all of the input's length
 */
struct Neighbors {
    std::string n, ne, e, se, s, sw, w, nw;

    const std::string& operator[](Direction d) const noexcept;
    std::string& operator[](Direction d) noexcept;
};

bool operator==(const Neighbors& lhs, const Neighbors& rhs) noexcept;
bool operator!=(const Neighbors& lhs, const Neighbors& rhs) noexcept;

} // namespace geohash
