#include <catch2/catch.hpp>
#include "config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using drover::linux_shell::ShellConfig;
using drover::linux_shell::parse_config;
using drover::linux_shell::load_config;

constexpr uint64_t GB = 1024ULL * 1024 * 1024;
constexpr uint64_t MB = 1024ULL * 1024;

static bool parse(const std::string& text, ShellConfig& cfg, std::vector<std::string>& errors) {
    std::istringstream in(text);
    return parse_config(in, cfg, errors);
}

static bool has_error_about(const std::vector<std::string>& errors, const std::string& key) {
    for (const auto& e : errors) {
        if (e.find(key) != std::string::npos) return true;
    }
    return false;
}

TEST_CASE("Full config parses", "[config]") {
    ShellConfig cfg;
    std::vector<std::string> errors;
    bool ok = parse(
        "# drover config\n"
        "source_paths = [\"/mnt/a\", '/mnt/b']\n"
        "destination_paths = [\"/mnt/x\"]\n"
        "min_size = 10gb\n"
        "max_size = \"50GB\"\n"
        "prefix = \"vol_\"\n"
        "transfer_method = rsync\n"
        "rsync_binary = /usr/local/bin/rsync\n"
        "max_parallel_transfers = 4\n"
        "log_level = debug\n"
        "report_file = /var/log/drover-failed.txt\n",
        cfg, errors);

    REQUIRE(ok);
    REQUIRE(errors.empty());
    REQUIRE(cfg.loop.source_paths == std::vector<std::string>{"/mnt/a", "/mnt/b"});
    REQUIRE(cfg.loop.destination_paths == std::vector<std::string>{"/mnt/x"});
    REQUIRE(cfg.loop.filter.min_size == 10 * GB);
    REQUIRE(cfg.loop.filter.max_size == 50 * GB);
    REQUIRE(cfg.loop.filter.prefix == "vol_");
    REQUIRE(cfg.transfer_method == "rsync");
    REQUIRE(cfg.rsync_binary == "/usr/local/bin/rsync");
    REQUIRE(cfg.loop.max_parallel_transfers == 4);
    REQUIRE(cfg.log_level == "debug");
    REQUIRE(cfg.report_file == "/var/log/drover-failed.txt");
}

TEST_CASE("Defaults apply to optional keys", "[config]") {
    ShellConfig cfg;
    std::vector<std::string> errors;
    REQUIRE(parse("source_paths = [\"/a\"]\nmax_size = 512mb\n", cfg, errors));
    REQUIRE(cfg.loop.destination_paths.empty());
    REQUIRE(cfg.loop.filter.min_size == 0);
    REQUIRE(cfg.loop.filter.max_size == 512 * MB);
    REQUIRE(cfg.loop.filter.prefix.empty());
    REQUIRE(cfg.transfer_method == "copy");
    REQUIRE(cfg.loop.max_parallel_transfers == 0);
    REQUIRE(cfg.log_level == "info");
}

TEST_CASE("Lists may span several lines", "[config]") {
    ShellConfig cfg;
    std::vector<std::string> errors;
    REQUIRE(parse(
        "source_paths = [\n"
        "  \"/mnt/a\",\n"
        "  # spare disk\n"
        "  \"/mnt/b, with comma\",\n"
        "]\n"
        "max_size = 1g\n",
        cfg, errors));
    REQUIRE(cfg.loop.source_paths == std::vector<std::string>{"/mnt/a", "/mnt/b, with comma"});
}

TEST_CASE("Paths expand home and environment variables", "[config]") {
    ::setenv("DROVER_TEST_ROOT", "/srv/pool", 1);
    const char* home = std::getenv("HOME");

    ShellConfig cfg;
    std::vector<std::string> errors;
    REQUIRE(parse("source_paths = [\"${DROVER_TEST_ROOT}/in\", \"~/in\"]\nmax_size = 1g\n",
                  cfg, errors));
    REQUIRE(cfg.loop.source_paths[0] == "/srv/pool/in");
    if (home) {
        REQUIRE(cfg.loop.source_paths[1] == std::string(home) + "/in");
    }
}

TEST_CASE("min_size above max_size is rejected", "[config]") {
    ShellConfig cfg;
    std::vector<std::string> errors;
    REQUIRE_FALSE(parse("source_paths = [\"/a\"]\nmin_size = 2g\nmax_size = 1g\n", cfg, errors));
    REQUIRE(has_error_about(errors, "min_size"));
}

TEST_CASE("Missing sources and max_size are both reported", "[config]") {
    ShellConfig cfg;
    std::vector<std::string> errors;
    REQUIRE_FALSE(parse("prefix = x\n", cfg, errors));
    REQUIRE(has_error_about(errors, "source_paths"));
    REQUIRE(has_error_about(errors, "max_size"));
}

TEST_CASE("Malformed values are rejected", "[config]") {
    ShellConfig cfg;
    std::vector<std::string> errors;
    REQUIRE_FALSE(parse(
        "source_paths = \"/a\"\n"
        "max_size = lots\n"
        "max_parallel_transfers = -1\n"
        "transfer_method = scp\n"
        "log_level = loud\n"
        "just some words\n",
        cfg, errors));
    REQUIRE(has_error_about(errors, "source_paths"));
    REQUIRE(has_error_about(errors, "max_size"));
    REQUIRE(has_error_about(errors, "max_parallel_transfers"));
    REQUIRE(has_error_about(errors, "transfer_method"));
    REQUIRE(has_error_about(errors, "log_level"));
    REQUIRE(has_error_about(errors, "expected key = value"));
}

TEST_CASE("Unknown size suffix is rejected", "[config]") {
    ShellConfig cfg;
    std::vector<std::string> errors;
    REQUIRE_FALSE(parse("source_paths = [\"/a\"]\nmax_size = 5 parsecs\n", cfg, errors));
    REQUIRE(has_error_about(errors, "max_size"));
}

TEST_CASE("Duplicate paths are rejected", "[config]") {
    ShellConfig cfg;
    std::vector<std::string> errors;
    REQUIRE_FALSE(parse(
        "source_paths = [\"/a\", \"/a\"]\n"
        "destination_paths = [\"/x\", \"/y\", \"/x\"]\n"
        "max_size = 1g\n",
        cfg, errors));
    REQUIRE(has_error_about(errors, "source_paths: duplicate"));
    REQUIRE(has_error_about(errors, "destination_paths: duplicate"));
}

TEST_CASE("Unreadable config file is a load failure", "[config]") {
    ShellConfig cfg;
    std::vector<std::string> errors;
    REQUIRE_FALSE(load_config("/nonexistent/drover.toml", cfg, errors));
    REQUIRE(has_error_about(errors, "cannot open"));
}

TEST_CASE("Config file is loaded from disk", "[config]") {
    fs::path path = fs::temp_directory_path() /
                    ("drover_config_test_" + std::to_string(::getpid()) + ".toml");
    {
        std::ofstream f(path);
        f << "source_paths = [\"/a\"]\n"
          << "destination_paths = [\"/b\"]\n"
          << "max_size = 100m\n";
    }

    ShellConfig cfg;
    std::vector<std::string> errors;
    REQUIRE(load_config(path.string(), cfg, errors));
    REQUIRE(cfg.loop.filter.max_size == 100 * MB);

    std::error_code ec;
    fs::remove(path, ec);
}

TEST_CASE("Default config path follows XDG_CONFIG_HOME", "[config]") {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
    REQUIRE(drover::linux_shell::default_config_path() == "/tmp/xdg-test/drover/drover.toml");
    ::unsetenv("XDG_CONFIG_HOME");
}
