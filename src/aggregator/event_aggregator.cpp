/// @file src/aggregator/event_aggregator.cpp
/// @brief EventAggregator: topics, questions, pulses and released vibes.

#include "chatviz/aggregator.hpp"
#include "utf8.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace chatviz::aggregator {

namespace {

/// Display label of a question without a topic.
constexpr const char* GENERAL_TOPIC = "GENERAL";

/// Treat an empty optional string as absent.
[[nodiscard]] std::optional<std::string>
normalized(const std::optional<std::string>& s) {
    if (s && !s->empty()) {
        return s;
    }
    return std::nullopt;
}

} // anonymous namespace

// ─── SentimentTally ──────────────────────────────────────────────────────────

double SentimentTally::bullish_ratio() const noexcept {
    const auto decided = bullish + bearish;
    if (decided == 0) {
        return 0.5;
    }
    return static_cast<double>(bullish) / static_cast<double>(decided);
}

bool SentimentTally::contested() const noexcept {
    if (bullish + bearish == 0) {
        return false;
    }
    const auto lo = std::min(bullish, bearish);
    const auto hi = std::max(bullish, bearish);
    return static_cast<double>(lo) / static_cast<double>(hi) > 0.5;
}

Lean SentimentTally::lean() const noexcept {
    if (bullish + bearish == 0) return Lean::Neutral;
    if (contested())            return Lean::Contested;
    return bullish_ratio() > 0.5 ? Lean::Bullish : Lean::Bearish;
}

// ─── EventAggregator: construction ───────────────────────────────────────────

EventAggregator::EventAggregator(AggregatorConfig config)
    : config_(std::move(config))
    , velocity_(config_.velocity_window_ms)
{}

// ─── EventAggregator::on_message ─────────────────────────────────────────────

IngestStatus EventAggregator::on_message(const MessageEvent& e, TimestampMs now) {
    const auto status = validate(e);
    if (status != IngestStatus::Accepted) {
        spdlog::warn("aggregator: rejected message from '{}': {}", e.author, to_string(status));
        return status;
    }

    velocity_.record_event(now);

    const auto topic = normalized(e.topic);
    if (topic) {
        apply_topic(*topic, e, e.sentiment.value_or(Sentiment::Neutral), now);
    }
    if (e.is_question) {
        apply_question(e, now);
    }
    return IngestStatus::Accepted;
}

void EventAggregator::apply_topic(const std::string& symbol, const MessageEvent& e,
                                  Sentiment sentiment, TimestampMs now) {
    auto [it, inserted] = topics_.try_emplace(symbol);
    TopicState& t = it->second;
    if (inserted) {
        t.first_seen = topic_order_.size();
        topic_order_.push_back(symbol);
        spdlog::debug("aggregator: new topic {}", symbol);
    }

    ++t.count;
    switch (sentiment) {
        case Sentiment::Bullish: ++t.sentiment.bullish; break;
        case Sentiment::Bearish: ++t.sentiment.bearish; break;
        case Sentiment::Neutral: ++t.sentiment.neutral; break;
    }
    t.last_update = now;

    t.recent_comments.push_back(Comment{.text = e.text, .sentiment = sentiment});
    while (t.recent_comments.size() > config_.recent_comments) {
        t.recent_comments.pop_front();
    }
}

void EventAggregator::apply_question(const MessageEvent& e, TimestampMs now) {
    const auto topic = normalized(e.topic);
    auto key = question_key(topic, e.text);

    auto it = std::find_if(questions_.begin(), questions_.end(),
                           [&](const QuestionEntry& q) { return q.key == key; });
    if (it != questions_.end()) {
        ++it->count;
        it->text   = e.text;
        it->author = e.author;
        it->time   = now;
        return;
    }

    questions_.push_back(QuestionEntry{
        .key    = std::move(key),
        .topic  = topic.value_or(GENERAL_TOPIC),
        .text   = e.text,
        .author = e.author,
        .count  = 1,
        .time   = now,
    });
    while (questions_.size() > config_.max_questions) {
        questions_.pop_front();
    }
}

std::string EventAggregator::question_key(const std::optional<std::string>& topic,
                                          std::string_view text) {
    if (topic && !topic->empty()) {
        return *topic;
    }
    return std::string(detail::utf8_prefix(text, constants::QUESTION_KEY_PREFIX));
}

// ─── EventAggregator::on_vibe / on_pulse ─────────────────────────────────────

IngestStatus EventAggregator::on_vibe(const VibeEvent& e) const noexcept {
    return validate(e);
}

IngestStatus EventAggregator::on_pulse(const PulseEvent& e, TimestampMs now) {
    const auto status = validate(e);
    if (status != IngestStatus::Accepted) {
        spdlog::warn("aggregator: rejected pulse: {}", to_string(status));
        return status;
    }

    pulses_.push_front(PulseEntry{
        .summary    = e.summary,
        .mood       = e.mood,
        .top_ticker = normalized(e.top_ticker),
        .time       = now,
    });
    while (pulses_.size() > config_.max_pulses) {
        pulses_.pop_back();
    }
    return IngestStatus::Accepted;
}

void EventAggregator::push_released_vibe(ReleasedVibe v) {
    vibes_.push_back(std::move(v));
    while (vibes_.size() > config_.max_released_vibes) {
        vibes_.pop_front();
    }
}

// ─── EventAggregator::sweep_expired_questions ────────────────────────────────

std::size_t EventAggregator::sweep_expired_questions(TimestampMs now) {
    const auto before = questions_.size();
    std::erase_if(questions_, [&](const QuestionEntry& q) {
        return now - q.time >= config_.question_ttl_ms;
    });
    const auto removed = before - questions_.size();
    if (removed > 0) {
        spdlog::debug("aggregator: swept {} expired question(s)", removed);
    }
    return removed;
}

// ─── EventAggregator queries ─────────────────────────────────────────────────

std::vector<RankedTopic> EventAggregator::top_topics(std::size_t n) const {
    std::vector<const std::string*> order;
    order.reserve(topic_order_.size());
    for (const auto& sym : topic_order_) {
        order.push_back(&sym);
    }

    // topic_order_ is first-seen order, so a stable sort breaks count ties by it.
    std::stable_sort(order.begin(), order.end(),
                     [&](const std::string* a, const std::string* b) {
                         return topics_.at(*a).count > topics_.at(*b).count;
                     });

    const std::size_t take = std::min(n, order.size());
    std::vector<RankedTopic> ranked;
    ranked.reserve(take);
    for (std::size_t i = 0; i < take; ++i) {
        const auto& sym = *order[i];
        const auto& t   = topics_.at(sym);
        ranked.push_back(RankedTopic{
            .symbol          = sym,
            .count           = t.count,
            .sentiment       = t.sentiment,
            .bullish_ratio   = t.sentiment.bullish_ratio(),
            .contested       = t.sentiment.contested(),
            .lean            = t.sentiment.lean(),
            .glow            = t.count >= constants::GLOW_COUNT_THRESHOLD,
            .recent_comments = {t.recent_comments.begin(), t.recent_comments.end()},
        });
    }
    return ranked;
}

const TopicState* EventAggregator::topic(std::string_view symbol) const {
    auto it = topics_.find(std::string(symbol));
    return it == topics_.end() ? nullptr : &it->second;
}

std::vector<QuestionEntry> EventAggregator::active_questions(TimestampMs now) const {
    std::vector<QuestionEntry> active;
    for (const auto& q : questions_) {
        if (now - q.time < config_.question_ttl_ms) {
            active.push_back(q);
        }
    }
    return active;
}

void EventAggregator::clear() noexcept {
    topics_.clear();
    topic_order_.clear();
    questions_.clear();
    pulses_.clear();
    vibes_.clear();
    velocity_.clear();
}

} // namespace chatviz::aggregator
