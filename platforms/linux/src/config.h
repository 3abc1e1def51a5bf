#pragma once
#include "round_loop.h"

#include <istream>
#include <string>
#include <vector>

namespace drover::linux_shell {

struct ShellConfig {
    drover::RoundLoopConfig loop;
    std::string transfer_method = "copy";
    std::string rsync_binary = "rsync";
    std::string log_level = "info";
    std::string report_file;   // empty = no report file
};

// $XDG_CONFIG_HOME/drover/drover.toml, ~/.config/drover/drover.toml or /etc/drover/drover.toml
std::string default_config_path();

// Load and validate config. If path is empty, uses default_config_path().
// Returns false if the file is unreadable or invalid; every problem found is
// appended to errors.
bool load_config(const std::string& config_path, ShellConfig& cfg,
                 std::vector<std::string>& errors);

// Parse and validate config text. Used by load_config.
bool parse_config(std::istream& in, ShellConfig& cfg, std::vector<std::string>& errors);

}
