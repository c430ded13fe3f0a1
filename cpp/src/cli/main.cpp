// =============================================================================
// geohash CLI - command-line front end for the geohash codec
// =============================================================================
//
// Usage:
//   geohash [global options] <command> [options]
//
// Commands:
//   encode      Encode a longitude/latitude pair to a geohash
//   bits        Encode a longitude/latitude pair to an integer geohash
//   decode      Decode a geohash to its center and error
//   bbox        Decode a geohash to its bounding box
//   neighbor    Adjacent geohash in one direction
//   neighbors   All eight adjacent geohashes
//   version     Show version information
//
// Examples:
//   geohash encode -120.6623 35.3003 -l 10
//   geohash decode 9q60y
//   geohash neighbor ww8p1r4t8 north-east
//
// =============================================================================

#include "commands.hpp"

int main(int argc, char* argv[]) {
    return geohash::cli::run(argc, argv);
}
