#include "config.h"
#include "drover_log.h"
#include "round_loop.h"
#include "signals.h"
#include "size_probe.h"
#include "transfer_operation.h"

#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Exit codes
// ---------------------------------------------------------------------------

static constexpr int EXIT_DONE    = 0;
static constexpr int EXIT_CONFIG  = 1;
static constexpr int EXIT_ABORTED = 2;
static constexpr int EXIT_STOPPED = 3;

// ---------------------------------------------------------------------------
// Utility: format bytes as human-readable
// ---------------------------------------------------------------------------

static std::string format_bytes(uint64_t bytes) {
    char buf[64];
    if (bytes >= 1024ULL * 1024 * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f GB",
                      static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0));
    } else if (bytes >= 1024ULL * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f MB",
                      static_cast<double>(bytes) / (1024.0 * 1024.0));
    } else if (bytes >= 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f KB",
                      static_cast<double>(bytes) / 1024.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%" PRIu64 " B", bytes);
    }
    return buf;
}

// ---------------------------------------------------------------------------
// Config loading shared by the commands
// ---------------------------------------------------------------------------

static bool load_or_report(const std::string& path, drover::linux_shell::ShellConfig& cfg) {
    std::vector<std::string> errors;
    if (!drover::linux_shell::load_config(path, cfg, errors)) {
        for (const auto& e : errors) {
            std::fprintf(stderr, "drover: config: %s\n", e.c_str());
        }
        return false;
    }

    drover::LogLevel level = drover::LogLevel::INFO;
    drover::parse_log_level(cfg.log_level, level);
    drover::set_log_level(level);
    return true;
}

static void print_filter(const drover::SizeFilter& f) {
    std::printf("Filter: prefix '%s', %s <= size < %s\n",
                f.prefix.c_str(),
                format_bytes(f.min_size).c_str(),
                format_bytes(f.max_size).c_str());
}

static void print_failures(const drover::FailureLedger& ledger) {
    std::vector<std::string> failed = ledger.entries();
    if (failed.empty()) return;
    std::printf("Sources that failed to transfer:\n");
    for (const auto& path : failed) {
        std::printf("%s\n", path.c_str());
    }
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static int cmd_run(const std::string& config_path) {
    using namespace drover::linux_shell;

    ShellConfig cfg;
    if (!load_or_report(config_path, cfg)) return EXIT_CONFIG;

    auto op = drover::create_transfer_operation(cfg.transfer_method, cfg.rsync_binary);
    if (!op) {
        std::fprintf(stderr, "drover: unknown transfer method '%s'\n", cfg.transfer_method.c_str());
        return EXIT_CONFIG;
    }

    install_signal_handlers();

    drover::FilesystemSizeProbe probe;
    drover::RoundLoop loop(cfg.loop, probe, *op);

    std::mutex out_mutex;
    loop.set_transfer_callback([&out_mutex](const drover::TransferEvent& ev) {
        std::lock_guard<std::mutex> lock(out_mutex);
        const char* src = ev.assignment.source.c_str();
        const char* dst = ev.assignment.destination.c_str();
        if (ev.phase == drover::TransferPhase::STARTED) {
            std::printf("%s -> %s started\n", src, dst);
        } else if (ev.result.ok()) {
            std::printf("%s -> %s done\n", src, dst);
        } else {
            std::printf("%s -> %s failed: %s\n", src, dst, ev.result.message.c_str());
        }
        std::fflush(stdout);
    });
    loop.set_state_callback([](drover::State old_s, drover::State new_s) {
        DROVER_LOG_DEBUG("state %s -> %s", drover::state_name(old_s), drover::state_name(new_s));
    });
    loop.set_stop_predicate([] { return shutdown_requested(); });

    std::printf("drover: %zu source(s), %zu destination(s), %s transfers\n",
                cfg.loop.source_paths.size(), cfg.loop.destination_paths.size(), op->name());
    print_filter(cfg.loop.filter);
    std::fflush(stdout);

    drover::State final_state = loop.run();

    int code = EXIT_DONE;
    switch (final_state) {
        case drover::State::SOURCES_EXHAUSTED:
            std::printf("Sources exhausted, nothing left to move.\n");
            break;
        case drover::State::DESTINATIONS_EXHAUSTED:
            std::printf("Destinations full, task complete.\n");
            break;
        case drover::State::ABORTED:
            std::printf("Aborted: %s\n", loop.error().c_str());
            code = EXIT_ABORTED;
            break;
        case drover::State::STOPPED:
            std::printf("Stopped.\n");
            code = EXIT_STOPPED;
            break;
        default:
            break;
    }
    std::printf("%d round(s), %zu folder(s) moved, %zu failed.\n",
                loop.rounds_completed(), loop.transfers_succeeded(), loop.ledger().size());
    print_failures(loop.ledger());

    if (!cfg.report_file.empty() && !loop.ledger().save(cfg.report_file)) {
        DROVER_LOG_ERROR("cannot write report file %s", cfg.report_file.c_str());
    }
    return code;
}

static int cmd_plan(const std::string& config_path) {
    using namespace drover::linux_shell;

    ShellConfig cfg;
    if (!load_or_report(config_path, cfg)) return EXIT_CONFIG;

    drover::FilesystemSizeProbe probe;
    drover::CopyTransfer unused_op;
    drover::RoundLoop loop(cfg.loop, probe, unused_op);

    print_filter(cfg.loop.filter);
    drover::MatchResult match = loop.plan();
    switch (match.status) {
        case drover::MatchStatus::ASSIGNED:
            for (const auto& a : match.assignments) {
                std::printf("%s -> %s\n", a.source.c_str(), a.destination.c_str());
            }
            if (match.assignments.size() < match.candidates.size()) {
                std::printf("%zu candidate(s) wait for a later round.\n",
                            match.candidates.size() - match.assignments.size());
            }
            return EXIT_DONE;
        case drover::MatchStatus::SOURCES_EXHAUSTED:
            std::printf("Sources exhausted, nothing to move.\n");
            return EXIT_DONE;
        case drover::MatchStatus::DESTINATIONS_EXHAUSTED:
            std::printf("%zu candidate(s) but no destination has more than %s free.\n",
                        match.candidates.size(), format_bytes(cfg.loop.filter.max_size).c_str());
            return EXIT_DONE;
        case drover::MatchStatus::PROBE_FAILED:
            std::printf("Aborted: %s\n", match.error.c_str());
            return EXIT_ABORTED;
    }
    return EXIT_DONE;
}

// ---------------------------------------------------------------------------
// Usage
// ---------------------------------------------------------------------------

static void print_usage() {
    std::printf(
        "Usage: drover <command> [-c <config>]\n"
        "\n"
        "Commands:\n"
        "  run        Move folders round by round until sources or destinations run out\n"
        "  plan       Show the assignments of the next round without moving anything\n"
        "  help       Show this help\n"
        "\n"
        "Default config: %s\n"
        "\n",
        drover::linux_shell::default_config_path().c_str());
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return EXIT_CONFIG;
    }

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage();
        return EXIT_DONE;
    }

    std::string config_path;
    for (int i = 2; i < argc; ++i) {
        if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::fprintf(stderr, "drover: unexpected argument '%s'\n", argv[i]);
            print_usage();
            return EXIT_CONFIG;
        }
    }

    if (cmd == "run")  return cmd_run(config_path);
    if (cmd == "plan") return cmd_plan(config_path);

    std::fprintf(stderr, "drover: unknown command '%s'\n", cmd.c_str());
    print_usage();
    return EXIT_CONFIG;
}
