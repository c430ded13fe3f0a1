#include "geohash/neighbors.hpp"
#include "geohash/codec.hpp"

#include <cmath>

namespace geohash {

Coordinate NeighborResolver::nudge(const DecodedCoordinate& decoded, Direction direction) noexcept {
    DirectionOffset step = direction_offset(direction);
    return Coordinate(
        decoded.center.x + 2.0 * std::abs(decoded.lon_error) * static_cast<double>(step.lon),
        decoded.center.y + 2.0 * std::abs(decoded.lat_error) * static_cast<double>(step.lat));
}

std::string NeighborResolver::neighbor(std::string_view hash, Direction direction) {
    DecodedCoordinate decoded = IntervalCodec::decode(hash);
    return IntervalCodec::encode(nudge(decoded, direction), hash.size());
}

Neighbors NeighborResolver::neighbors(std::string_view hash) {
    DecodedCoordinate decoded = IntervalCodec::decode(hash);

    Neighbors result;
    for (Direction d : ALL_DIRECTIONS) {
        result[d] = IntervalCodec::encode(nudge(decoded, d), hash.size());
    }
    return result;
}

} // namespace geohash
