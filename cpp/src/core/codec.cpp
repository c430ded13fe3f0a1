#include "geohash/codec.hpp"
#include "geohash/alphabet.hpp"
#include "geohash/error.hpp"
#include "geohash/logging.hpp"

namespace geohash {

namespace {

/**
 * Running longitude/latitude intervals of the bisection.
 * The active axis is a function of the bit index: even = longitude.
 */
struct Bisection {
    double min_lon = LON_MIN;
    double max_lon = LON_MAX;
    double min_lat = LAT_MIN;
    double max_lat = LAT_MAX;

    static constexpr bool is_lon_bit(size_t bit_index) noexcept {
        return (bit_index & 1) == 0;
    }

    // Encode direction: pick the half containing the coordinate, return the bit
    uint32_t split(const Coordinate& coord, size_t bit_index) noexcept {
        if (is_lon_bit(bit_index)) {
            double mid = (max_lon + min_lon) / 2.0;
            if (coord.x > mid) {
                min_lon = mid;
                return 1;
            }
            max_lon = mid;
            return 0;
        }
        double mid = (max_lat + min_lat) / 2.0;
        if (coord.y > mid) {
            min_lat = mid;
            return 1;
        }
        max_lat = mid;
        return 0;
    }

    // Decode direction: narrow toward the upper half on 1, lower half on 0
    void narrow(uint32_t bit, size_t bit_index) noexcept {
        if (is_lon_bit(bit_index)) {
            double mid = (max_lon + min_lon) / 2.0;
            if (bit) {
                min_lon = mid;
            } else {
                max_lon = mid;
            }
        } else {
            double mid = (max_lat + min_lat) / 2.0;
            if (bit) {
                min_lat = mid;
            } else {
                max_lat = mid;
            }
        }
    }

    BoundingBox box() const noexcept {
        return BoundingBox(Coordinate(min_lon, min_lat), Coordinate(max_lon, max_lat));
    }
};

std::string bit_count_message(size_t bit_count) {
    return "bit_count " + std::to_string(bit_count) + " exceeds " +
           std::to_string(IntervalCodec::MAX_FIXED_BITS) + " bits";
}

} // anonymous namespace

std::string IntervalCodec::encode(const Coordinate& coord, size_t length) {
    std::string out;
    out.reserve(length);

    Bisection state;
    uint32_t value = 0;
    uint32_t bits = 0;
    size_t bit_index = 0;

    while (out.size() < length) {
        value = (value << 1) | state.split(coord, bit_index++);

        if (++bits == Alphabet::BITS_PER_SYMBOL) {
            out.push_back(Alphabet::symbol_for(static_cast<uint8_t>(value)));
            value = 0;
            bits = 0;
        }
    }
    return out;
}

uint64_t IntervalCodec::encode_fixed_bits(const Coordinate& coord, size_t bit_count) {
    GEOHASH_CHECK_ARGUMENT(bit_count <= MAX_FIXED_BITS, bit_count_message(bit_count));

    Bisection state;
    uint64_t hash = 0;
    for (size_t i = 0; i < bit_count; ++i) {
        hash = (hash << 1) | state.split(coord, i);
    }
    return hash;
}

BoundingBox IntervalCodec::decode_fixed_bits(uint64_t hash, size_t bit_count) {
    GEOHASH_CHECK_ARGUMENT(bit_count <= MAX_FIXED_BITS, bit_count_message(bit_count));

    Bisection state;
    for (size_t i = 0; i < bit_count; ++i) {
        uint32_t bit = static_cast<uint32_t>((hash >> (bit_count - 1 - i)) & 1ULL);
        state.narrow(bit, i);
    }
    return state.box();
}

BoundingBox IntervalCodec::decode_bbox(std::string_view hash) {
    Bisection state;
    size_t bit_index = 0;

    for (size_t pos = 0; pos < hash.size(); ++pos) {
        auto value = Alphabet::find_value(hash[pos]);
        if (!value) {
            LOG_DEBUG("Rejected geohash symbol code ", static_cast<int>(static_cast<unsigned char>(hash[pos])),
                      " at position ", pos);
            throw InvalidSymbolError(hash[pos], pos, __func__);
        }

        for (int shift = Alphabet::BITS_PER_SYMBOL - 1; shift >= 0; --shift) {
            state.narrow((*value >> shift) & 1U, bit_index++);
        }
    }
    return state.box();
}

DecodedCoordinate IntervalCodec::decode(std::string_view hash) {
    BoundingBox box = decode_bbox(hash);
    return DecodedCoordinate(box.center(),
                             (box.max.x - box.min.x) / 2.0,
                             (box.max.y - box.min.y) / 2.0);
}

} // namespace geohash
