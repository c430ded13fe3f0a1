#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "geohash/types.hpp"

namespace geohash::cli {

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

/**
 * Command handlers. argv holds the arguments after the command name.
 * Output goes to std::cout, usage errors to std::cerr; invalid input
 * is reported by throwing GeohashException.
 */
int cmd_encode(int argc, char* argv[]);
int cmd_bits(int argc, char* argv[]);
int cmd_decode(int argc, char* argv[]);
int cmd_bbox(int argc, char* argv[]);
int cmd_neighbor(int argc, char* argv[]);
int cmd_neighbors(int argc, char* argv[]);
int cmd_version(int argc, char* argv[]);
int cmd_help(int argc, char* argv[]);

// nullptr when no command has that name
const Command* find_command(std::string_view name);

/**
 * Run one command, turning any exception into "Error: <what>" on
 * std::cerr and exit status 1.
 */
int execute(const Command& cmd, int argc, char* argv[]);

/**
 * Full command line including the program name:
 *   geohash [global options] <command> [options]
 */
int run(int argc, char* argv[]);

// Argument parsing; each throws InvalidArgumentError on bad input
double parse_double(const std::string& text, const char* what);
size_t parse_count(const std::string& text, const char* what);
Coordinate parse_coordinate(const std::string& lon, const std::string& lat);

} // namespace geohash::cli
