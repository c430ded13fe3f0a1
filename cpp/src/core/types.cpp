#include "geohash/types.hpp"

#include <cctype>

namespace geohash {

const char* direction_name(Direction d) noexcept {
    switch (d) {
        case Direction::N:  return "n";
        case Direction::NE: return "ne";
        case Direction::E:  return "e";
        case Direction::SE: return "se";
        case Direction::S:  return "s";
        case Direction::SW: return "sw";
        case Direction::W:  return "w";
        case Direction::NW: return "nw";
    }
    return "?";
}

std::optional<Direction> parse_direction(std::string_view name) {
    // Fold to lowercase and drop separators: "North-East" -> "northeast"
    std::string folded;
    folded.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_' || c == ' ') continue;
        folded.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    struct Alias {
        const char* short_name;
        const char* long_name;
        Direction direction;
    };
    static const Alias aliases[] = {
        {"n",  "north",     Direction::N},
        {"ne", "northeast", Direction::NE},
        {"e",  "east",      Direction::E},
        {"se", "southeast", Direction::SE},
        {"s",  "south",     Direction::S},
        {"sw", "southwest", Direction::SW},
        {"w",  "west",      Direction::W},
        {"nw", "northwest", Direction::NW},
    };

    for (const auto& alias : aliases) {
        if (folded == alias.short_name || folded == alias.long_name) {
            return alias.direction;
        }
    }
    return std::nullopt;
}

const std::string& Neighbors::operator[](Direction d) const noexcept {
    switch (d) {
        case Direction::N:  return n;
        case Direction::NE: return ne;
        case Direction::E:  return e;
        case Direction::SE: return se;
        case Direction::S:  return s;
        case Direction::SW: return sw;
        case Direction::W:  return w;
        case Direction::NW: return nw;
    }
    return n;
}

std::string& Neighbors::operator[](Direction d) noexcept {
    const Neighbors& self = *this;
    return const_cast<std::string&>(self[d]);
}

bool operator==(const Neighbors& lhs, const Neighbors& rhs) noexcept {
    return lhs.n == rhs.n && lhs.ne == rhs.ne && lhs.e == rhs.e && lhs.se == rhs.se &&
           lhs.s == rhs.s && lhs.sw == rhs.sw && lhs.w == rhs.w && lhs.nw == rhs.nw;
}

bool operator!=(const Neighbors& lhs, const Neighbors& rhs) noexcept {
    return !(lhs == rhs);
}

} // namespace geohash
