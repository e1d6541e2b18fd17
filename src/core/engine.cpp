/// @file src/core/engine.cpp
/// @brief Engine: event dispatch, timers and scene assembly.

#include "chatviz/engine.hpp"
#include "chatviz/velocity.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>

namespace chatviz::core {

namespace {

[[nodiscard]] std::optional<std::string>
validate_aggregator(const aggregator::AggregatorConfig& c) {
    if (c.max_questions == 0 || c.max_pulses == 0 || c.max_released_vibes == 0)
        return "aggregator caps must be at least 1";
    if (c.question_ttl_ms <= 0)
        return "question TTL must be positive";
    if (c.velocity_window_ms <= 0)
        return "velocity window must be positive";
    return std::nullopt;
}

[[nodiscard]] std::optional<std::string>
validate_pacer(const pacer::PacerConfig& c) {
    if (!std::isfinite(c.initial_batch_interval_ms) || c.initial_batch_interval_ms <= 0.0)
        return "initial batch interval must be positive";
    if (!std::isfinite(c.min_delay_ms) || !std::isfinite(c.max_delay_ms) ||
        c.min_delay_ms <= 0.0 || c.min_delay_ms > c.max_delay_ms)
        return "drip delays must satisfy 0 < min <= max";
    if (c.kick_delay_ms < 0)
        return "kick delay must not be negative";
    return std::nullopt;
}

[[nodiscard]] std::optional<std::string>
validate_rise(const layout::RiseConfig& c) {
    if (!(c.duration_min_s > 0.0) || c.duration_span_s < 0.0)
        return "rise duration must be positive";
    return std::nullopt;
}

/// Replace every invalid section by its default.
[[nodiscard]] EngineConfig sanitized(EngineConfig c) {
    if (auto err = validate_aggregator(c.aggregator)) {
        spdlog::warn("engine: {}; using default aggregator config", *err);
        c.aggregator = aggregator::AggregatorConfig{};
    }
    if (auto err = validate_pacer(c.pacer)) {
        spdlog::warn("engine: {}; using default pacer config", *err);
        c.pacer = pacer::PacerConfig{};
    }
    if (auto err = c.layout.validate()) {
        spdlog::warn("engine: {}; using default layout config", *err);
        c.layout = layout::LayoutConfig{};
    }
    if (auto err = validate_rise(c.rise)) {
        spdlog::warn("engine: {}; using default rise config", *err);
        c.rise = layout::RiseConfig{};
    }
    if (c.question_sweep_interval_ms <= 0) {
        spdlog::warn("engine: sweep interval must be positive; using {} ms",
                     constants::QUESTION_SWEEP_INTERVAL_MS);
        c.question_sweep_interval_ms = constants::QUESTION_SWEEP_INTERVAL_MS;
    }
    return c;
}

} // anonymous namespace

// ─── EngineConfig ────────────────────────────────────────────────────────────

std::optional<std::string> EngineConfig::validate() const {
    if (auto err = validate_aggregator(aggregator)) return err;
    if (auto err = validate_pacer(pacer))           return err;
    if (auto err = layout.validate())               return err;
    if (auto err = validate_rise(rise))             return err;
    if (question_sweep_interval_ms <= 0)
        return std::string("question sweep interval must be positive");
    return std::nullopt;
}

// ─── Construction ────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(sanitized(std::move(config)))
    , aggregator_(config_.aggregator)
    , pacer_(config_.pacer)
    , layout_(config_.layout)
    , rising_(config_.rise)
{}

// ─── Events ──────────────────────────────────────────────────────────────────

IngestStatus Engine::handle(const ChatEvent& event, TimestampMs now) {
    return std::visit([&](const auto& e) -> IngestStatus {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MessageEvent>) {
            return on_message(e, now);
        } else if constexpr (std::is_same_v<T, VibeEvent>) {
            return on_vibe(e, now);
        } else {
            return on_pulse(e, now);
        }
    }, event);
}

IngestStatus Engine::on_message(const MessageEvent& e, TimestampMs now) {
    const auto status = aggregator_.on_message(e, now);
    if (status != IngestStatus::Accepted) {
        return status;
    }
    if (config_.verbose) {
        spdlog::debug("engine: message @{} topic={} question={}",
                      now, e.topic.value_or("-"), e.is_question);
    }
    if (e.topic && !e.topic->empty()) {
        resync_layout();
    }
    return status;
}

IngestStatus Engine::on_vibe(const VibeEvent& e, TimestampMs now) {
    const auto status = aggregator_.on_vibe(e);
    if (status != IngestStatus::Accepted) {
        spdlog::warn("engine: rejected vibe: {}", to_string(status));
        return status;
    }
    const bool started = pacer_.enqueue(e, now);
    if (config_.verbose) {
        spdlog::debug("engine: vibe @{} queued ({} waiting{})",
                      now, pacer_.queue_length(), started ? ", drip started" : "");
    }
    return status;
}

IngestStatus Engine::on_pulse(const PulseEvent& e, TimestampMs now) {
    return aggregator_.on_pulse(e, now);
}

// ─── Timers and frames ───────────────────────────────────────────────────────

std::size_t Engine::tick(TimestampMs now) {
    if (!last_sweep_) {
        last_sweep_ = now;
    } else if (now - *last_sweep_ >= config_.question_sweep_interval_ms) {
        aggregator_.sweep_expired_questions(now);
        last_sweep_ = now;
    }

    const double rate = aggregator_.current_rate(now);
    auto released = pacer_.tick(now, rate);
    if (!released) {
        return 0;
    }

    aggregator_.push_released_vibe(*released);
    rising_.spawn(*released);
    if (vibe_listener_) {
        vibe_listener_(*released);
    }
    return 1;
}

void Engine::advance_frame() {
    layout_.step();
}

std::optional<TimestampMs> Engine::next_deadline() const noexcept {
    std::optional<TimestampMs> deadline = pacer_.next_fire_time();

    const auto& questions = aggregator_.questions();
    if (!questions.empty()) {
        const TimestampMs base = last_sweep_.value_or(questions.front().time);
        const TimestampMs sweep_at = base + config_.question_sweep_interval_ms;
        deadline = deadline ? std::min(*deadline, sweep_at) : sweep_at;
    }
    return deadline;
}

// ─── Read side ───────────────────────────────────────────────────────────────

SceneSnapshot Engine::snapshot(TimestampMs now) {
    SceneSnapshot s{
        .at                          = now,
        .topics                      = {},
        .questions                   = aggregator_.active_questions(now),
        .pulses                      = {aggregator_.pulses().begin(), aggregator_.pulses().end()},
        .vibes                       = {aggregator_.released_vibes().begin(),
                                        aggregator_.released_vibes().end()},
        .rising                      = rising_.sample(now),
        .velocity                    = aggregator_.current_rate(now),
        .band                        = VelocityBand::Quiet,
        .queued_vibes                = pacer_.queue_length(),
        .estimated_batch_interval_ms = pacer_.estimated_batch_interval_ms(),
    };
    s.band = velocity::VelocityTracker::classify(s.velocity);

    auto ranked = aggregator_.top_topics(config_.layout.max_visible);
    s.topics.reserve(ranked.size());
    for (auto& topic : ranked) {
        const layout::Bubble* b = layout_.bubble(topic.symbol);
        if (b == nullptr) {
            continue;
        }
        const Rgb color = color_for(topic.lean);
        s.topics.push_back(TopicView{
            .topic        = std::move(topic),
            .x            = b->position.x(),
            .y            = b->position.y(),
            .radius       = b->radius,
            .color        = color,
            .just_updated = b->just_updated,
        });
    }
    // Each growth pulse is reported by exactly one snapshot.
    layout_.acknowledge_updates();
    return s;
}

void Engine::set_extent(double width, double height) {
    layout_.set_extent(width, height);
}

void Engine::reset() {
    aggregator_.clear();
    pacer_.clear();
    layout_.clear();
    rising_.clear();
    last_sweep_.reset();
    spdlog::debug("engine: session reset");
}

void Engine::resync_layout() {
    const auto ranked = aggregator_.top_topics(config_.layout.max_visible);
    layout_.sync(ranked);
}

} // namespace chatviz::core
