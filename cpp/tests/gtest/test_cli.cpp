// =============================================================================
// Command-Line Front End Tests
// =============================================================================

#include <gtest/gtest.h>
#include "commands.hpp"
#include "geohash/config.hpp"
#include "geohash/error.hpp"
#include "geohash/geohash.hpp"
#include "geohash/logging.hpp"
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

using namespace geohash;

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("GEOHASH_LOG_LEVEL");
        unsetenv("GEOHASH_DEFAULT_LENGTH");
        unsetenv("GEOHASH_OUTPUT_PRECISION");
        Config::getInstance().clear();
        set_log_output(log_);
        set_log_level(LogLevel::INFO);

        saved_precision_ = std::cout.precision();
        saved_out_ = std::cout.rdbuf(out_.rdbuf());
        saved_err_ = std::cerr.rdbuf(err_.rdbuf());

        config_path_ = std::filesystem::temp_directory_path() /
                       ("geohash_cli_test_" + std::to_string(getpid()) + ".env");
    }

    void TearDown() override {
        std::cout.rdbuf(saved_out_);
        std::cerr.rdbuf(saved_err_);
        std::cout.precision(saved_precision_);

        std::error_code ec;
        std::filesystem::remove(config_path_, ec);
        Config::getInstance().clear();
        set_log_output(std::clog);
        set_log_level(LogLevel::INFO);
    }

    // Runs "geohash -c <config> <args...>"; the config file only exists if written
    int run_cli(const std::vector<std::string>& args) {
        std::vector<std::string> storage = {"geohash", "-c", config_path_.string()};
        storage.insert(storage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        for (auto& s : storage) argv.push_back(s.data());
        argv.push_back(nullptr);
        return cli::run(static_cast<int>(storage.size()), argv.data());
    }

    void write_config(const std::string& contents) {
        std::ofstream out(config_path_);
        out << contents;
    }

    std::ostringstream out_;
    std::ostringstream err_;
    std::ostringstream log_;
    std::filesystem::path config_path_;

private:
    std::streambuf* saved_out_ = nullptr;
    std::streambuf* saved_err_ = nullptr;
    std::streamsize saved_precision_ = 6;
};

// =============================================================================
// Argument parsing
// =============================================================================

TEST_F(CliTest, ParseDouble) {
    EXPECT_DOUBLE_EQ(cli::parse_double("-120.6623", "longitude"), -120.6623);
    EXPECT_DOUBLE_EQ(cli::parse_double("35", "latitude"), 35.0);
    EXPECT_THROW(cli::parse_double("abc", "longitude"), InvalidArgumentError);
    EXPECT_THROW(cli::parse_double("12x", "longitude"), InvalidArgumentError);
    EXPECT_THROW(cli::parse_double("", "longitude"), InvalidArgumentError);
}

TEST_F(CliTest, ParseCount) {
    EXPECT_EQ(cli::parse_count("0", "length"), 0u);
    EXPECT_EQ(cli::parse_count("12", "length"), 12u);
    EXPECT_THROW(cli::parse_count("-3", "length"), InvalidArgumentError);
    EXPECT_THROW(cli::parse_count("+3", "length"), InvalidArgumentError);
    EXPECT_THROW(cli::parse_count("4a", "length"), InvalidArgumentError);
    EXPECT_THROW(cli::parse_count("99999999999999999999999", "length"), InvalidArgumentError);
}

TEST_F(CliTest, ParseCoordinateChecksRange) {
    Coordinate c = cli::parse_coordinate("-180", "90");
    EXPECT_DOUBLE_EQ(c.x, -180.0);
    EXPECT_DOUBLE_EQ(c.y, 90.0);

    EXPECT_THROW(cli::parse_coordinate("180.5", "0"), InvalidArgumentError);
    EXPECT_THROW(cli::parse_coordinate("0", "-90.1"), InvalidArgumentError);
    EXPECT_THROW(cli::parse_coordinate("nan", "0"), InvalidArgumentError);

    try {
        cli::parse_coordinate("200", "0");
        FAIL() << "Expected InvalidArgumentError";
    } catch (const InvalidArgumentError& e) {
        EXPECT_EQ(e.context(), "parse_coordinate");
    }
}

// =============================================================================
// Commands
// =============================================================================

TEST_F(CliTest, EncodeDefaultLength) {
    EXPECT_EQ(run_cli({"encode", "-120.6623", "35.3003"}), 0) << err_.str();
    EXPECT_EQ(out_.str(), "9q60y60rh\n");
}

TEST_F(CliTest, EncodeExplicitLength) {
    EXPECT_EQ(run_cli({"encode", "-120.6623", "35.3003", "-l", "10"}), 0) << err_.str();
    EXPECT_EQ(out_.str(), "9q60y60rhs\n");
}

TEST_F(CliTest, EncodeLengthFromConfigFile) {
    write_config("encode.length = 4\n");
    EXPECT_EQ(run_cli({"encode", "-120.6623", "35.3003"}), 0) << err_.str();
    EXPECT_EQ(out_.str(), "9q60\n");
}

TEST_F(CliTest, EncodeRejectsLengthOutsideConfiguredRange) {
    EXPECT_EQ(run_cli({"encode", "10", "10", "-l", "0"}), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_EQ(err_.str().rfind("Error: ", 0), 0u) << err_.str();
    EXPECT_NE(err_.str().find("length must be in 1..22, got 0"), std::string::npos) << err_.str();

    err_.str("");
    EXPECT_EQ(run_cli({"encode", "10", "10", "-l", "99999999999999999"}), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("length must be in 1..22"), std::string::npos) << err_.str();

    err_.str("");
    EXPECT_EQ(run_cli({"encode", "10", "10", "-l", "23"}), 1);
    EXPECT_EQ(out_.str(), "");
}

TEST_F(CliTest, EncodeRejectsOutOfRangeCoordinate) {
    EXPECT_EQ(run_cli({"encode", "-181", "0"}), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("Coordinate out of range"), std::string::npos) << err_.str();
}

TEST_F(CliTest, EncodeUsageOnMissingArguments) {
    EXPECT_EQ(run_cli({"encode", "10"}), 1);
    EXPECT_NE(err_.str().find("Usage: geohash encode"), std::string::npos);
}

TEST_F(CliTest, BitsPrintsValueAndBinary) {
    EXPECT_EQ(run_cli({"bits", "-120.6623", "35.3003", "-b", "10"}), 0) << err_.str();
    EXPECT_EQ(out_.str(), "310\n0100110110\n");
}

TEST_F(CliTest, BitsDefaultFollowsLength) {
    EXPECT_EQ(run_cli({"bits", "-120.6623", "35.3003"}), 0) << err_.str();
    std::string expected_bits(45, '0');
    uint64_t value = 10657992999664ULL;
    for (size_t i = 0; i < 45; ++i) {
        expected_bits[44 - i] = ((value >> i) & 1ULL) ? '1' : '0';
    }
    EXPECT_EQ(out_.str(), "10657992999664\n" + expected_bits + "\n");
}

TEST_F(CliTest, BitsRejectsBadCounts) {
    EXPECT_EQ(run_cli({"bits", "10", "10", "-b", "65"}), 1);
    EXPECT_NE(err_.str().find("exceeds 64 bits"), std::string::npos) << err_.str();

    err_.str("");
    EXPECT_EQ(run_cli({"bits", "10", "10", "-b", "0"}), 1);
    EXPECT_NE(err_.str().find("bits must be at least 1"), std::string::npos) << err_.str();
}

TEST_F(CliTest, Decode) {
    EXPECT_EQ(run_cli({"decode", "9q60y"}), 0) << err_.str();
    EXPECT_EQ(out_.str(),
              "lon: -120.651855469\n"
              "lat: 35.3100585938\n"
              "lon_error: 0.02197265625\n"
              "lat_error: 0.02197265625\n");
}

TEST_F(CliTest, DecodeUsesConfiguredPrecision) {
    write_config("output.precision = 6\n");
    EXPECT_EQ(run_cli({"decode", "9q60y"}), 0) << err_.str();
    EXPECT_NE(out_.str().find("lon: -120.652\n"), std::string::npos) << out_.str();
    EXPECT_NE(out_.str().find("lat: 35.3101\n"), std::string::npos) << out_.str();
}

TEST_F(CliTest, DecodeInvalidSymbol) {
    EXPECT_EQ(run_cli({"decode", "ww8pl"}), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("Invalid geohash symbol 'l' at position 4"), std::string::npos) << err_.str();
}

TEST_F(CliTest, Bbox) {
    EXPECT_EQ(run_cli({"bbox", "9q"}), 0) << err_.str();
    EXPECT_EQ(out_.str(), "min: -123.75 33.75\nmax: -112.5 39.375\n");
}

TEST_F(CliTest, NeighborAcceptsLongDirectionNames) {
    EXPECT_EQ(run_cli({"neighbor", "ww8p1r4t8", "north-east"}), 0) << err_.str();
    EXPECT_EQ(out_.str(), "ww8p1r4tc\n");
}

TEST_F(CliTest, NeighborUnknownDirection) {
    EXPECT_EQ(run_cli({"neighbor", "ww8p1r4t8", "up"}), 1);
    EXPECT_NE(err_.str().find("Unknown direction: 'up'"), std::string::npos) << err_.str();
}

TEST_F(CliTest, NeighborsListedInCompassOrder) {
    EXPECT_EQ(run_cli({"neighbors", "ww8p1r4t8"}), 0) << err_.str();
    EXPECT_EQ(out_.str(),
              "n: ww8p1r4tb\n"
              "ne: ww8p1r4tc\n"
              "e: ww8p1r4t9\n"
              "se: ww8p1r4t3\n"
              "s: ww8p1r4t2\n"
              "sw: ww8p1r4mr\n"
              "w: ww8p1r4mx\n"
              "nw: ww8p1r4mz\n");
}

TEST_F(CliTest, Version) {
    EXPECT_EQ(run_cli({"version"}), 0);
    EXPECT_EQ(out_.str(), std::string("geohash ") + GEOHASH_VERSION_STRING + "\n");
}

TEST_F(CliTest, UnknownCommandPrintsHelp) {
    EXPECT_EQ(run_cli({"frobnicate"}), 1);
    EXPECT_NE(err_.str().find("Unknown command: frobnicate"), std::string::npos);
    EXPECT_NE(out_.str().find("Commands:"), std::string::npos);
    EXPECT_NE(out_.str().find("neighbors"), std::string::npos);
}

TEST_F(CliTest, NoCommandPrintsHelp) {
    EXPECT_EQ(run_cli({}), 1);
    EXPECT_NE(out_.str().find("Usage: geohash"), std::string::npos);
}

// =============================================================================
// Global options and dispatch
// =============================================================================

TEST_F(CliTest, InvalidConfigurationIsReported) {
    write_config("encode.length = 0\n");
    EXPECT_EQ(run_cli({"version"}), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_EQ(err_.str().rfind("Error: ", 0), 0u) << err_.str();
    EXPECT_NE(err_.str().find("[100]"), std::string::npos) << err_.str();
}

TEST_F(CliTest, VerboseLogsConfiguration) {
    EXPECT_EQ(run_cli({"-v", "version"}), 0);
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::DEBUG);
    EXPECT_NE(log_.str().find("Current configuration:"), std::string::npos) << log_.str();
    EXPECT_NE(log_.str().find("encode.length = 9"), std::string::npos) << log_.str();
}

TEST_F(CliTest, QuietLogsErrorsOnly) {
    EXPECT_EQ(run_cli({"-q", "encode", "10", "10", "--bogus"}), 0);
    EXPECT_EQ(Logger::getInstance().level(), LogLevel::ERROR);
    EXPECT_EQ(log_.str().find("Ignoring unknown option"), std::string::npos) << log_.str();
}

TEST_F(CliTest, UnknownOptionWarns) {
    EXPECT_EQ(run_cli({"encode", "10", "10", "--bogus"}), 0);
    EXPECT_NE(log_.str().find("Ignoring unknown option: --bogus"), std::string::npos) << log_.str();
}

TEST_F(CliTest, FindCommand) {
    ASSERT_NE(cli::find_command("decode"), nullptr);
    EXPECT_STREQ(cli::find_command("decode")->name, "decode");
    EXPECT_EQ(cli::find_command("deco"), nullptr);
}

TEST_F(CliTest, ExecuteReportsUnexpectedExceptions) {
    cli::Command failing{"failing", "Always throws",
                         +[](int, char**) -> int { throw std::length_error("too long"); }};

    EXPECT_EQ(cli::execute(failing, 0, nullptr), 1);
    EXPECT_EQ(err_.str().rfind("Error: ", 0), 0u) << err_.str();
    EXPECT_NE(err_.str().find("[500]"), std::string::npos) << err_.str();
    EXPECT_NE(err_.str().find("too long"), std::string::npos) << err_.str();
}
