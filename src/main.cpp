/// @file src/main.cpp
/// @brief umb CLI entry point.
///
/// Usage:
///   umb_cli [--config <file>] --ingest <csv_file> [--instrument <id>]
///   umb_cli [--config <file>] --stats [--json]
///   umb_cli [--config <file>] --events [ai|trading]
///   umb_cli [--config <file>] --sweep
///   umb_cli --help

#include "umb/bridge.hpp"
#include "umb/codec.hpp"
#include "umb/config.hpp"
#include "umb/data_loader.hpp"
#include "umb/log.hpp"
#include "umb/memory.hpp"

#include <fmt/core.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  umb_cli [--config <file>] --ingest <csv_file> [--instrument <id>]\n"
        "                                     Store OHLCV bars through the trading bridge\n"
        "  umb_cli [--config <file>] --stats [--json]\n"
        "                                     Print memory statistics\n"
        "  umb_cli [--config <file>] --events [ai|trading]\n"
        "                                     List unprocessed events\n"
        "  umb_cli [--config <file>] --sweep  Run one retention sweep\n"
        "  umb_cli --help                     Show this help\n"
        "\n"
        "CSV format (header required):\n"
        "  timestamp,open,high,low,close,volume\n"
        "\n"
        "Environment overrides: UMB_DB_PATH, UMB_REDIS_HOST, UMB_REDIS_PORT,\n"
        "  UMB_REDIS_PASSWORD, UMB_REDIS_DB, UMB_CACHE_NAMESPACE, UMB_CACHE_TIMEOUT_MS,\n"
        "  UMB_CACHE_MAX_ENTRIES, UMB_DAYS_TO_KEEP, UMB_LOG_LEVEL\n"
    );
}

struct Options {
    std::optional<std::string> config_path;
    std::string                command;
    std::string                argument;
    std::string                instrument = "CSV";
    bool                       json = false;
};

/// Returns nullopt (after printing why) on a usage error.
std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        const bool has_value = i + 1 < argc;

        if (arg == "--config" || arg == "--instrument" || arg == "--ingest") {
            if (!has_value) {
                fmt::print(stderr, "Error: {} requires a value\n", arg);
                return std::nullopt;
            }
            const std::string value(argv[++i]);
            if (arg == "--config") {
                opts.config_path = value;
            } else if (arg == "--instrument") {
                opts.instrument = value;
            } else {
                opts.command  = arg;
                opts.argument = value;
            }
        } else if (arg == "--events") {
            opts.command = arg;
            if (has_value && argv[i + 1][0] != '-') {
                opts.argument = argv[++i];
            }
        } else if (arg == "--stats" || arg == "--sweep" || arg == "--help" || arg == "-h") {
            opts.command = arg;
        } else if (arg == "--json") {
            opts.json = true;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        }
    }
    return opts;
}

/// Defaults, then the config file, then the environment; validated.
std::optional<umb::core::MemoryConfig> load_config(const Options& opts) {
    umb::core::MemoryConfig config;
    if (opts.config_path) {
        auto loaded = umb::core::load_config_file(*opts.config_path);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot load configuration '{}'\n", *opts.config_path);
            return std::nullopt;
        }
        config = std::move(*loaded);
    }

    std::vector<std::string> errors;
    umb::core::apply_env(config, errors);
    for (auto& e : umb::core::validate(config)) {
        errors.push_back(std::move(e));
    }
    if (!errors.empty()) {
        for (const auto& e : errors) {
            fmt::print(stderr, "Config error: {}\n", e);
        }
        return std::nullopt;
    }
    return config;
}

int run_ingest(umb::memory::UnifiedMemory& memory, const Options& opts) {
    auto bars = umb::core::DataLoader::load_csv(opts.argument, opts.instrument);
    if (!bars) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.argument);
        return 1;
    }
    if (bars->empty()) {
        fmt::print(stderr, "Error: no valid bars loaded from '{}'\n", opts.argument);
        return 1;
    }

    umb::bridge::BridgeAdapter trading(memory, umb::Source::TradingFramework);
    std::size_t stored = 0;
    std::size_t partial = 0;
    for (const auto& bar : *bars) {
        const auto result = trading.on_bar(bar);
        if (result.status == umb::memory::WriteStatus::PartialFailure) ++partial;
        if (result.committed()) ++stored;
    }

    fmt::print("Stored {}/{} bars for {} from '{}'", stored, bars->size(),
               opts.instrument, opts.argument);
    if (partial > 0) {
        fmt::print(" ({} without a cache copy)", partial);
    }
    fmt::print("\n");
    return stored == bars->size() ? 0 : 1;
}

int run_stats(umb::memory::UnifiedMemory& memory, const Options& opts) {
    const auto stats = memory.stats();
    if (opts.json) {
        fmt::print("{}", stats.to_json().toStyledString());
    } else {
        fmt::print("{}", stats.to_string());
    }
    return 0;
}

int run_events(umb::memory::UnifiedMemory& memory, const Options& opts) {
    std::optional<umb::Source> target;
    if (!opts.argument.empty()) {
        target = umb::source_from_string(opts.argument);
        if (!target) {
            fmt::print(stderr, "Error: --events expects 'ai' or 'trading', got '{}'\n",
                       opts.argument);
            return 1;
        }
    }

    auto events = memory.unprocessed_events(target);
    if (!events) {
        fmt::print(stderr, "Error: cannot read events from the durable store\n");
        return 1;
    }
    for (const auto& ev : *events) {
        fmt::print("{}  {:<28} {} -> {}  {}\n", ev.id, ev.event_type,
                   umb::to_string(ev.source),
                   ev.target ? umb::to_string(*ev.target) : std::string_view{"all"},
                   umb::codec::encode_payload(ev.event_data));
    }
    fmt::print("{} unprocessed event(s)\n", events->size());
    return 0;
}

int run_sweep(umb::memory::UnifiedMemory& memory) {
    const auto removed = memory.sweep();
    if (!removed) {
        fmt::print(stderr, "Error: sweep failed\n");
        return 1;
    }
    fmt::print("Sweep removed {} rows\n", *removed);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }
    if (opts->command == "--help" || opts->command == "-h") {
        print_usage();
        return 0;
    }
    if (opts->command.empty()) {
        fmt::print(stderr, "Error: no command given\n");
        print_usage();
        return 1;
    }

    const auto config = load_config(*opts);
    if (!config) {
        return 1;
    }
    if (auto level = umb::log::level_from_string(config->log_level)) {
        umb::log::set_level(*level);
    }
    auto memory = umb::memory::UnifiedMemory::open(*config);
    if (!memory) {
        fmt::print(stderr, "Error: cannot open memory store '{}'\n", config->db_path);
        return 1;
    }

    int rc = 1;
    if (opts->command == "--ingest") {
        rc = run_ingest(*memory, *opts);
    } else if (opts->command == "--stats") {
        rc = run_stats(*memory, *opts);
    } else if (opts->command == "--events") {
        rc = run_events(*memory, *opts);
    } else if (opts->command == "--sweep") {
        rc = run_sweep(*memory);
    }
    memory->close();
    return rc;
}
