/// @file src/main.cpp
/// @brief chatviz CLI entry point.
///
/// Usage:
///   chatviz --replay <log> [--width W] [--height H] [--fps F] [--seed S] [--verbose]
///   chatviz --help

#include "chatviz/engine.hpp"
#include "chatviz/event_log.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  chatviz --replay <log> [options]   Replay a chat event log\n"
        "  chatviz --help                     Show this help\n"
        "\n"
        "Options:\n"
        "  --width W     Layout width in px  (default 400)\n"
        "  --height H    Layout height in px (default 600)\n"
        "  --fps F       Simulated frame rate (default 60)\n"
        "  --seed S      Seed for jitter, spawn and drift\n"
        "  --verbose     Debug logging\n"
        "\n"
        "Log format (tab-separated, '-' = absent):\n"
        "  <t_ms> message <topic> <sentiment> <author> <q|-> <text>\n"
        "  <t_ms> vibe    <funny|uplifting> <text>\n"
        "  <t_ms> pulse   <mood> <top_ticker> <summary>\n"
    );
}

struct ReplayOptions {
    std::string   log_path;
    double        width   = 400.0;
    double        height  = 600.0;
    double        fps     = 60.0;
    std::optional<std::uint64_t> seed;
    bool          verbose = false;
};

[[nodiscard]] std::optional<double> parse_double(const std::string& s) {
    try {
        std::size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

[[nodiscard]] std::optional<std::uint64_t> parse_seed(const std::string& s) {
    try {
        std::size_t pos = 0;
        const auto v = std::stoull(s, &pos, 0);
        if (pos != s.size()) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/// Parse flags following `--replay <log>`. Returns nullopt on a bad flag.
[[nodiscard]] std::optional<ReplayOptions> parse_options(int argc, char* argv[]) {
    ReplayOptions opts;
    opts.log_path = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string flag(argv[i]);
        if (flag == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string value(argv[++i]);

        if (flag == "--seed") {
            opts.seed = parse_seed(value);
            if (!opts.seed) {
                fmt::print(stderr, "Error: invalid seed '{}'\n", value);
                return std::nullopt;
            }
            continue;
        }

        const auto v = parse_double(value);
        if (!v || *v <= 0.0) {
            fmt::print(stderr, "Error: {} expects a positive number, got '{}'\n", flag, value);
            return std::nullopt;
        }
        if      (flag == "--width")  opts.width  = *v;
        else if (flag == "--height") opts.height = *v;
        else if (flag == "--fps")    opts.fps    = *v;
        else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
    }
    return opts;
}

void print_scene(const chatviz::core::SceneSnapshot& s) {
    using chatviz::to_string;

    fmt::print("── scene @ {} ms ──\n", s.at);
    fmt::print("velocity {:.2f} msg/s ({})  queued vibes {}  batch estimate {:.0f} ms\n",
               s.velocity, to_string(s.band), s.queued_vibes, s.estimated_batch_interval_ms);

    fmt::print("\nTopics ({}):\n", s.topics.size());
    for (const auto& t : s.topics) {
        fmt::print("  {:<8} count={:<4} bull={:.2f} {:<9} #{:06x}{} at ({:6.1f}, {:6.1f}) r={:.1f}\n",
                   t.topic.symbol, t.topic.count, t.topic.bullish_ratio,
                   to_string(t.topic.lean), t.color.value, t.topic.glow ? " *" : "  ",
                   t.x, t.y, t.radius);
    }

    fmt::print("\nQuestions ({}):\n", s.questions.size());
    for (const auto& q : s.questions) {
        fmt::print("  [{}] x{} {}: {}\n", q.topic, q.count, q.author, q.text);
    }

    fmt::print("\nPulses ({}):\n", s.pulses.size());
    for (const auto& p : s.pulses) {
        fmt::print("  {} ({}{}): {}\n", p.time, p.mood,
                   p.top_ticker ? ", " + *p.top_ticker : std::string{}, p.summary);
    }

    fmt::print("\nReleased vibes ({}):\n", s.vibes.size());
    for (const auto& v : s.vibes) {
        fmt::print("  {} {:<9} {}\n", v.released_at, to_string(v.kind), v.text);
    }
}

/// Replay a log on a simulated clock. Returns 0 on success, 1 on error.
int run_replay(const ReplayOptions& opts) {
    auto events = chatviz::core::EventLog::load(opts.log_path);
    if (!events) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.log_path);
        return 1;
    }
    if (events->empty()) {
        fmt::print(stderr, "Error: no valid events loaded from '{}'\n", opts.log_path);
        return 1;
    }

    chatviz::core::EngineConfig config;
    config.layout.width  = opts.width;
    config.layout.height = opts.height;
    config.verbose       = opts.verbose;
    if (opts.seed) {
        config.pacer.seed  = *opts.seed;
        config.layout.seed = *opts.seed;
        config.rise.seed   = *opts.seed;
    }
    if (auto err = config.validate()) {
        fmt::print(stderr, "Error: {}\n", *err);
        return 1;
    }

    chatviz::core::Engine engine(config);
    engine.set_vibe_listener([](const chatviz::ReleasedVibe& v) {
        spdlog::info("vibe @{} [{}] {}", v.released_at, chatviz::to_string(v.kind), v.text);
    });

    const auto frame_ms = std::max<chatviz::TimestampMs>(
        1, static_cast<chatviz::TimestampMs>(std::llround(1000.0 / opts.fps)));
    chatviz::TimestampMs clock = events->front().at;

    auto run_frame = [&] {
        engine.tick(clock);
        engine.advance_frame();
        clock += frame_ms;
    };

    std::size_t rejected = 0;
    for (const auto& ev : *events) {
        while (clock < ev.at) {
            run_frame();
        }
        if (engine.handle(ev.event, ev.at) != chatviz::IngestStatus::Accepted) {
            ++rejected;
        }
    }

    // Drain: each queued vibe needs at most one max-delay interval.
    const auto drain_budget = static_cast<chatviz::TimestampMs>(
        (engine.drip().queue_length() + 1) * static_cast<std::size_t>(config.pacer.max_delay_ms));
    const chatviz::TimestampMs drain_until = clock + drain_budget + frame_ms;
    while (engine.drip().state() != chatviz::pacer::VibePacer::LoopState::Idle &&
           clock < drain_until) {
        run_frame();
    }

    fmt::print("Replayed {} events from '{}' ({} rejected)\n\n",
               events->size(), opts.log_path, rejected);
    print_scene(engine.snapshot(clock));
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--replay") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --replay requires a log file path\n");
            print_usage();
            return 1;
        }
        auto opts = parse_options(argc, argv);
        if (!opts) {
            print_usage();
            return 1;
        }
        spdlog::set_level(opts->verbose ? spdlog::level::debug : spdlog::level::warn);
        return run_replay(*opts);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
