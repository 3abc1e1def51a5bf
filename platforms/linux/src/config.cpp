#include "config.h"
#include "drover_log.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <string>

namespace drover::linux_shell {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

// Expand ~ to $HOME and $VAR / ${VAR} environment variables in a string.
std::string expand_path(const std::string& raw) {
    std::string result;
    result.reserve(raw.size());

    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '~' && (i == 0) &&
            (i + 1 == raw.size() || raw[i + 1] == '/')) {
            const char* home = std::getenv("HOME");
            result += home ? home : "~";
        } else if (raw[i] == '$') {
            // Environment variable
            ++i;
            bool braced = false;
            if (i < raw.size() && raw[i] == '{') {
                braced = true;
                ++i;
            }
            std::string var_name;
            while (i < raw.size()) {
                if (braced && raw[i] == '}') {
                    ++i;
                    break;
                }
                if (!braced && !(std::isalnum(static_cast<unsigned char>(raw[i])) || raw[i] == '_'))
                    break;
                var_name += raw[i];
                ++i;
            }
            --i; // will be incremented by the for loop

            const char* val = std::getenv(var_name.c_str());
            if (val) result += val;
        } else {
            result += raw[i];
        }
    }
    return result;
}

// Parse a human-readable byte size string: "1gb", "500mb", "10tb", "1024", etc.
bool parse_byte_size(const std::string& raw, uint64_t& out) {
    std::string s = trim(raw);
    if (s.empty()) return false;

    // Find where the numeric part ends
    size_t num_end = 0;
    bool has_dot = false;
    while (num_end < s.size()) {
        char c = s[num_end];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            ++num_end;
        } else if (c == '.' && !has_dot) {
            has_dot = true;
            ++num_end;
        } else {
            break;
        }
    }
    if (num_end == 0) return false;

    std::string suffix = to_lower(trim(s.substr(num_end)));

    uint64_t multiplier = 1;
    if (suffix.empty() || suffix == "b") {
        multiplier = 1;
    } else if (suffix == "kb" || suffix == "k") {
        multiplier = 1024ULL;
    } else if (suffix == "mb" || suffix == "m") {
        multiplier = 1024ULL * 1024;
    } else if (suffix == "gb" || suffix == "g") {
        multiplier = 1024ULL * 1024 * 1024;
    } else if (suffix == "tb" || suffix == "t") {
        multiplier = 1024ULL * 1024 * 1024 * 1024;
    } else if (suffix == "pb" || suffix == "p") {
        multiplier = 1024ULL * 1024 * 1024 * 1024 * 1024;
    } else {
        return false;
    }

    std::string number = s.substr(0, num_end);
    if (!has_dot) {
        errno = 0;
        unsigned long long whole = std::strtoull(number.c_str(), nullptr, 10);
        if (errno == ERANGE || whole > UINT64_MAX / multiplier) return false;
        out = static_cast<uint64_t>(whole) * multiplier;
        return true;
    }

    double value = std::strtod(number.c_str(), nullptr);
    out = static_cast<uint64_t>(value * static_cast<double>(multiplier));
    return true;
}

bool parse_int(const std::string& raw, int& out) {
    std::string s = trim(raw);
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0' || v < INT32_MIN || v > INT32_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

// Remove surrounding quotes from a string value (single or double).
std::string unquote(const std::string& s) {
    if (s.size() >= 2) {
        char front = s.front();
        char back = s.back();
        if ((front == '"' && back == '"') || (front == '\'' && back == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

// Split the inside of ["a", "b"] on commas that are not inside quotes.
bool parse_list(const std::string& raw, std::vector<std::string>& out) {
    std::string s = trim(raw);
    if (s.size() < 2 || s.front() != '[' || s.back() != ']') return false;
    s = s.substr(1, s.size() - 2);

    out.clear();
    std::string item;
    char quote = '\0';
    for (char c : s) {
        if (quote) {
            if (c == quote) quote = '\0';
            item += c;
        } else if (c == '"' || c == '\'') {
            quote = c;
            item += c;
        } else if (c == ',') {
            std::string v = trim(item);
            if (!v.empty()) out.push_back(expand_path(unquote(v)));
            item.clear();
        } else {
            item += c;
        }
    }
    if (quote) return false;

    std::string v = trim(item);
    if (!v.empty()) out.push_back(expand_path(unquote(v)));
    return true;
}

// Brackets outside quotes, for lists that continue on following lines.
bool list_is_closed(const std::string& value) {
    char quote = '\0';
    for (char c : value) {
        if (quote) {
            if (c == quote) quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == ']') {
            return true;
        }
    }
    return false;
}

void find_duplicates(const std::vector<std::string>& paths, const char* key,
                     std::vector<std::string>& errors) {
    std::set<std::string> seen;
    for (const auto& p : paths) {
        if (!seen.insert(p).second) {
            errors.push_back(std::string(key) + ": duplicate path " + p);
        }
    }
}

} // anonymous namespace

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/drover/drover.toml";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/drover/drover.toml";
    }
    return "/etc/drover/drover.toml";
}

// ---------------------------------------------------------------------------
// parse_config
// ---------------------------------------------------------------------------

bool parse_config(std::istream& in, ShellConfig& cfg, std::vector<std::string>& errors) {
    size_t errors_before = errors.size();
    bool have_max_size = false;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            errors.push_back("line " + std::to_string(line_no) + ": expected key = value");
            continue;
        }

        std::string key   = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        const std::string where = "line " + std::to_string(line_no) + ": " + key;

        // Lists may span several lines until the closing bracket
        if (!value.empty() && value[0] == '[') {
            std::string more;
            while (!list_is_closed(value) && std::getline(in, more)) {
                ++line_no;
                more = trim(more);
                if (more.empty() || more[0] == '#') continue;
                value += " " + more;
            }
        }

        if (key == "source_paths" || key == "destination_paths") {
            std::vector<std::string> paths;
            if (!parse_list(value, paths)) {
                errors.push_back(where + ": expected a list like [\"/a\", \"/b\"]");
                continue;
            }
            if (key == "source_paths") {
                cfg.loop.source_paths = std::move(paths);
            } else {
                cfg.loop.destination_paths = std::move(paths);
            }
        } else if (key == "min_size") {
            if (!parse_byte_size(unquote(value), cfg.loop.filter.min_size))
                errors.push_back(where + ": invalid size '" + value + "'");
        } else if (key == "max_size") {
            if (!parse_byte_size(unquote(value), cfg.loop.filter.max_size))
                errors.push_back(where + ": invalid size '" + value + "'");
            else
                have_max_size = true;
        } else if (key == "prefix") {
            cfg.loop.filter.prefix = unquote(value);
        } else if (key == "transfer_method") {
            cfg.transfer_method = to_lower(unquote(value));
        } else if (key == "rsync_binary") {
            cfg.rsync_binary = expand_path(unquote(value));
        } else if (key == "max_parallel_transfers") {
            int n = 0;
            if (!parse_int(value, n) || n < 0)
                errors.push_back(where + ": expected a non-negative integer");
            else
                cfg.loop.max_parallel_transfers = n;
        } else if (key == "log_level") {
            cfg.log_level = to_lower(unquote(value));
        } else if (key == "report_file") {
            cfg.report_file = expand_path(unquote(value));
        } else {
            DROVER_LOG_WARN("config %s: unknown key ignored", where.c_str());
        }
    }

    // Validation
    if (cfg.loop.source_paths.empty()) {
        errors.push_back("source_paths: at least one source path is required");
    }
    if (!have_max_size || cfg.loop.filter.max_size == 0) {
        errors.push_back("max_size: required and must be greater than zero");
    }
    if (cfg.loop.filter.min_size > cfg.loop.filter.max_size) {
        errors.push_back("min_size: must not exceed max_size");
    }
    find_duplicates(cfg.loop.source_paths, "source_paths", errors);
    find_duplicates(cfg.loop.destination_paths, "destination_paths", errors);
    if (cfg.transfer_method != "copy" && cfg.transfer_method != "rsync") {
        errors.push_back("transfer_method: expected copy or rsync, got '" + cfg.transfer_method + "'");
    }
    drover::LogLevel level;
    if (!drover::parse_log_level(cfg.log_level, level)) {
        errors.push_back("log_level: expected error, warn, info or debug, got '" + cfg.log_level + "'");
    }

    return errors.size() == errors_before;
}

// ---------------------------------------------------------------------------
// load_config
// ---------------------------------------------------------------------------

bool load_config(const std::string& config_path, ShellConfig& cfg,
                 std::vector<std::string>& errors) {
    std::string path = config_path.empty() ? default_config_path() : config_path;
    std::ifstream file(path);
    if (!file.is_open()) {
        errors.push_back("cannot open config file " + path);
        return false;
    }
    return parse_config(file, cfg, errors);
}

} // namespace drover::linux_shell
