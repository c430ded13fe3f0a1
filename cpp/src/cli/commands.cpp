#include "commands.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <vector>

#include "geohash/config.hpp"
#include "geohash/error.hpp"
#include "geohash/geohash.hpp"
#include "geohash/logging.hpp"

namespace geohash::cli {

// =============================================================================
// Command Registry
// =============================================================================

static const Command g_commands[] = {
    {"encode",    "Encode <lon> <lat> to a geohash string", cmd_encode},
    {"bits",      "Encode <lon> <lat> to an integer geohash", cmd_bits},
    {"decode",    "Decode a geohash to center and half-errors", cmd_decode},
    {"bbox",      "Decode a geohash to its bounding box", cmd_bbox},
    {"neighbor",  "Adjacent geohash in one direction", cmd_neighbor},
    {"neighbors", "All eight adjacent geohashes", cmd_neighbors},
    {"version",   "Show version information", cmd_version},
    {"help",      "Show this help message", cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "geohash.env";
    bool verbose = false;
    bool quiet = false;
};

namespace {

// Returns the number of arguments consumed, program name included
int parse_global_options(int argc, char* argv[], GlobalOptions& options) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            options.quiet = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }
    return std::min(i, argc);
}

void apply_global_options(const GlobalOptions& options) {
    if (!init_config(options.config_file)) {
        throw ConfigError("Invalid configuration", options.config_file,
                          "Check the GEOHASH_* environment variables and the config file");
    }
    if (options.verbose) {
        set_log_level(LogLevel::DEBUG);
        Config::getInstance().print();
    } else if (options.quiet) {
        set_log_level(LogLevel::ERROR);
    }
}

// Options start with '-' unless they parse as a (negative) number
bool is_positional(const std::string& arg) {
    if (arg.empty() || arg[0] != '-') return true;
    return arg.size() > 1 && (std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
}

std::ostream& with_precision(std::ostream& os) {
    int precision = Config::getInstance().get<int>("output.precision", DEFAULT_OUTPUT_PRECISION);
    return os << std::setprecision(precision);
}

std::string to_binary(uint64_t value, size_t bit_count) {
    std::string out;
    out.reserve(bit_count);
    for (size_t i = bit_count; i > 0; --i) {
        out.push_back(((value >> (i - 1)) & 1ULL) ? '1' : '0');
    }
    return out;
}

size_t configured_length() {
    return static_cast<size_t>(Config::getInstance().get<int>("encode.length", DEFAULT_HASH_LENGTH));
}

} // anonymous namespace

// =============================================================================
// Argument Parsing
// =============================================================================

double parse_double(const std::string& text, const char* what) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        GEOHASH_THROW_INVALID_ARG(std::string("Not a number for ") + what + ": '" + text + "'");
    }
    if (consumed != text.size()) {
        GEOHASH_THROW_INVALID_ARG(std::string("Trailing characters in ") + what + ": '" + text + "'");
    }
    return value;
}

size_t parse_count(const std::string& text, const char* what) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        GEOHASH_THROW_INVALID_ARG(std::string("Not a non-negative integer for ") + what + ": '" + text + "'");
    }

    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::out_of_range&) {
        GEOHASH_THROW_INVALID_ARG(std::string("Value too large for ") + what + ": '" + text + "'");
    }
    if (consumed != text.size()) {
        GEOHASH_THROW_INVALID_ARG(std::string("Trailing characters in ") + what + ": '" + text + "'");
    }
    return static_cast<size_t>(value);
}

Coordinate parse_coordinate(const std::string& lon, const std::string& lat) {
    Coordinate coord(parse_double(lon, "longitude"), parse_double(lat, "latitude"));
    GEOHASH_CHECK_ARGUMENT(coord.is_valid(),
                           "Coordinate out of range: (" + lon + ", " + lat +
                               "); longitude must be in [-180, 180] and latitude in [-90, 90]");
    return coord;
}

// =============================================================================
// Commands
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "geohash - base-32 geohash encoder/decoder\n";
    std::cout << "Version " << GEOHASH_VERSION_STRING << "\n\n";
    std::cout << "Usage: geohash [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Config file (default: geohash.env)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Log errors only\n";
    std::cout << "\nCommand Options:\n";
    std::cout << "  encode -l, --length <n> Geohash length, 1.." << MAX_CONFIG_HASH_LENGTH
              << " (default: encode.length)\n";
    std::cout << "  bits -b, --bits <n>     Bit count, 1..64 (default: 5 * encode.length, capped at 60)\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  GEOHASH_LOG_LEVEL         debug|info|warn|error|fatal\n";
    std::cout << "  GEOHASH_DEFAULT_LENGTH    Default geohash length (1..22)\n";
    std::cout << "  GEOHASH_OUTPUT_PRECISION  Significant digits for decoded values (1..17)\n";
    std::cout << "\nExamples:\n";
    std::cout << "  geohash encode -120.6623 35.3003 -l 10\n";
    std::cout << "  geohash decode 9q60y\n";
    std::cout << "  geohash neighbors ww8p1r4t8\n";

    return 0;
}

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "geohash " << GEOHASH_VERSION_STRING << "\n";
    return 0;
}

int cmd_encode(int argc, char* argv[]) {
    std::vector<std::string> positional;
    size_t length = configured_length();

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-l" || arg == "--length") && i + 1 < argc) {
            length = parse_count(argv[++i], "length");
        } else if (is_positional(arg)) {
            positional.push_back(arg);
        } else {
            LOG_WARN("Ignoring unknown option: ", arg);
        }
    }

    if (positional.size() != 2) {
        std::cerr << "Usage: geohash encode <lon> <lat> [-l|--length <n>]\n";
        return 1;
    }

    GEOHASH_CHECK_ARGUMENT(length >= 1 && length <= static_cast<size_t>(MAX_CONFIG_HASH_LENGTH),
                           "length must be in 1.." + std::to_string(MAX_CONFIG_HASH_LENGTH) +
                               ", got " + std::to_string(length));

    Coordinate coord = parse_coordinate(positional[0], positional[1]);
    LOG_DEBUG("Encoding (", coord.x, ", ", coord.y, ") at length ", length);
    std::cout << IntervalCodec::encode(coord, length) << "\n";
    return 0;
}

int cmd_bits(int argc, char* argv[]) {
    std::vector<std::string> positional;
    size_t bit_count = std::min<size_t>(configured_length() * Alphabet::BITS_PER_SYMBOL, 60);

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-b" || arg == "--bits") && i + 1 < argc) {
            bit_count = parse_count(argv[++i], "bits");
        } else if (is_positional(arg)) {
            positional.push_back(arg);
        } else {
            LOG_WARN("Ignoring unknown option: ", arg);
        }
    }

    if (positional.size() != 2) {
        std::cerr << "Usage: geohash bits <lon> <lat> [-b|--bits <n>]\n";
        return 1;
    }

    GEOHASH_CHECK_ARGUMENT(bit_count >= 1, "bits must be at least 1");

    Coordinate coord = parse_coordinate(positional[0], positional[1]);
    uint64_t hash = IntervalCodec::encode_fixed_bits(coord, bit_count);
    std::cout << hash << "\n";
    std::cout << to_binary(hash, bit_count) << "\n";
    return 0;
}

int cmd_decode(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: geohash decode <hash>\n";
        return 1;
    }

    DecodedCoordinate decoded = IntervalCodec::decode(argv[0]);
    with_precision(std::cout);
    std::cout << "lon: " << decoded.center.x << "\n";
    std::cout << "lat: " << decoded.center.y << "\n";
    std::cout << "lon_error: " << decoded.lon_error << "\n";
    std::cout << "lat_error: " << decoded.lat_error << "\n";
    return 0;
}

int cmd_bbox(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: geohash bbox <hash>\n";
        return 1;
    }

    BoundingBox box = IntervalCodec::decode_bbox(argv[0]);
    with_precision(std::cout);
    std::cout << "min: " << box.min.x << " " << box.min.y << "\n";
    std::cout << "max: " << box.max.x << " " << box.max.y << "\n";
    return 0;
}

int cmd_neighbor(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: geohash neighbor <hash> <direction>\n";
        std::cerr << "Directions: n ne e se s sw w nw (or north, north-east, ...)\n";
        return 1;
    }

    std::optional<Direction> direction = parse_direction(argv[1]);
    if (!direction) {
        throw InvalidArgumentError(std::string("Unknown direction: '") + argv[1] + "'", __func__,
                                   "Use one of n ne e se s sw w nw");
    }

    std::cout << NeighborResolver::neighbor(argv[0], *direction) << "\n";
    return 0;
}

int cmd_neighbors(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: geohash neighbors <hash>\n";
        return 1;
    }

    Neighbors result = NeighborResolver::neighbors(argv[0]);
    for (Direction d : ALL_DIRECTIONS) {
        std::cout << direction_name(d) << ": " << result[d] << "\n";
    }
    return 0;
}

// =============================================================================
// Dispatch
// =============================================================================

const Command* find_command(std::string_view name) {
    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (name == cmd->name) {
            return cmd;
        }
    }
    return nullptr;
}

int execute(const Command& cmd, int argc, char* argv[]) {
    try {
        return cmd.handler(argc, argv);
    } catch (const GeohashException& e) {
        LOG_DEBUG("Command '", cmd.name, "' failed with ", error_code_name(e.code()));
        std::cerr << "Error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        GeohashException internal(ErrorCode::INTERNAL_ERROR, e.what(), cmd.name);
        LOG_ERROR("Command '", cmd.name, "' failed unexpectedly: ", e.what());
        std::cerr << "Error: " << internal.what() << "\n";
    }
    return 1;
}

int run(int argc, char* argv[]) {
    GlobalOptions options;
    int consumed = parse_global_options(argc, argv, options);
    argc -= consumed;
    argv += consumed;

    try {
        apply_global_options(options);
    } catch (const GeohashException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (argc < 1) {
        cmd_help(0, nullptr);
        return 1;
    }

    const Command* cmd = find_command(argv[0]);
    if (!cmd) {
        std::cerr << "Unknown command: " << argv[0] << "\n";
        cmd_help(0, nullptr);
        return 1;
    }

    return execute(*cmd, argc - 1, argv + 1);
}

} // namespace geohash::cli
