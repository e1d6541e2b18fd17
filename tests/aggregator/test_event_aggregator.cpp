/// @file tests/aggregator/test_event_aggregator.cpp
/// @brief Unit tests for EventAggregator.
///
/// Test categories:
///   - Topic counting, sentiment tally and comment ring
///   - Ranking: count descending, ties by first-seen order
///   - Lean, contested and glow derivation
///   - Question dedup, TTL and cap
///   - Pulse and released-vibe caps
///   - Rejection of invalid events without state change

#include <gtest/gtest.h>
#include "chatviz/aggregator.hpp"

#include <string>

using namespace chatviz;
using namespace chatviz::aggregator;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static MessageEvent msg(std::string topic, Sentiment s, std::string text = "gm") {
    return MessageEvent{
        .topic     = std::move(topic),
        .sentiment = s,
        .text      = std::move(text),
        .author    = "anon",
    };
}

static MessageEvent question(std::optional<std::string> topic, std::string text,
                             std::string author = "asker") {
    return MessageEvent{
        .topic       = std::move(topic),
        .sentiment   = Sentiment::Neutral,
        .text        = std::move(text),
        .author      = std::move(author),
        .is_question = true,
    };
}

// ─── Topics ──────────────────────────────────────────────────────────────────

TEST(EventAggregator, CountsTopicAndTallies) {
    EventAggregator agg;
    ASSERT_EQ(agg.on_message(msg("AAPL", Sentiment::Bullish), 1), IngestStatus::Accepted);
    ASSERT_EQ(agg.on_message(msg("AAPL", Sentiment::Bearish), 2), IngestStatus::Accepted);
    ASSERT_EQ(agg.on_message(msg("AAPL", Sentiment::Neutral), 3), IngestStatus::Accepted);

    const TopicState* t = agg.topic("AAPL");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->count, 3u);
    EXPECT_EQ(t->sentiment.bullish, 1u);
    EXPECT_EQ(t->sentiment.bearish, 1u);
    EXPECT_EQ(t->sentiment.neutral, 1u);
    EXPECT_EQ(t->last_update, 3);
}

TEST(EventAggregator, UnknownSentimentCountsAsNeutral) {
    EventAggregator agg;
    MessageEvent m = msg("NVDA", Sentiment::Bullish);
    m.sentiment.reset();
    ASSERT_EQ(agg.on_message(m, 0), IngestStatus::Accepted);
    EXPECT_EQ(agg.topic("NVDA")->sentiment.neutral, 1u);
}

TEST(EventAggregator, MessageWithoutTopicCreatesNoTopic) {
    EventAggregator agg;
    MessageEvent m = msg("", Sentiment::Bullish);
    ASSERT_EQ(agg.on_message(m, 0), IngestStatus::Accepted);
    m.topic.reset();
    ASSERT_EQ(agg.on_message(m, 1), IngestStatus::Accepted);
    EXPECT_EQ(agg.topic_count(), 0u);
    // Still counted by the velocity tracker.
    EXPECT_DOUBLE_EQ(agg.current_rate(2), 2.0 / 5.0);
}

TEST(EventAggregator, RecentCommentRingKeepsNewestFive) {
    EventAggregator agg;
    for (int i = 0; i < 8; ++i) {
        (void)agg.on_message(msg("TSLA", Sentiment::Neutral, "c" + std::to_string(i)), i);
    }
    const auto& ring = agg.topic("TSLA")->recent_comments;
    ASSERT_EQ(ring.size(), 5u);
    EXPECT_EQ(ring.front().text, "c3");
    EXPECT_EQ(ring.back().text, "c7");
}

TEST(EventAggregator, TopTopicsRankedByCountThenFirstSeen) {
    EventAggregator agg;
    (void)agg.on_message(msg("A", Sentiment::Neutral), 0);
    (void)agg.on_message(msg("B", Sentiment::Neutral), 1);
    (void)agg.on_message(msg("C", Sentiment::Neutral), 2);
    (void)agg.on_message(msg("C", Sentiment::Neutral), 3);

    auto top = agg.top_topics(10);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].symbol, "C");
    EXPECT_EQ(top[1].symbol, "A");
    EXPECT_EQ(top[2].symbol, "B");

    auto two = agg.top_topics(2);
    ASSERT_EQ(two.size(), 2u);
    EXPECT_EQ(two[1].symbol, "A");
}

TEST(EventAggregator, LeanContestedAndGlow) {
    EventAggregator agg;
    for (int i = 0; i < 6; ++i) (void)agg.on_message(msg("AAPL", Sentiment::Bullish), i);
    for (int i = 0; i < 4; ++i) (void)agg.on_message(msg("AAPL", Sentiment::Bearish), 10 + i);
    for (int i = 0; i < 3; ++i) (void)agg.on_message(msg("TSLA", Sentiment::Bearish), 20 + i);
    (void)agg.on_message(msg("GME", Sentiment::Neutral), 30);

    auto top = agg.top_topics(3);
    ASSERT_EQ(top.size(), 3u);

    EXPECT_EQ(top[0].symbol, "AAPL");
    EXPECT_DOUBLE_EQ(top[0].bullish_ratio, 0.6);
    EXPECT_TRUE(top[0].contested);          // 4/6 > 0.5
    EXPECT_EQ(top[0].lean, Lean::Contested);
    EXPECT_TRUE(top[0].glow);               // count 10

    EXPECT_EQ(top[1].symbol, "TSLA");
    EXPECT_DOUBLE_EQ(top[1].bullish_ratio, 0.0);
    EXPECT_FALSE(top[1].contested);
    EXPECT_EQ(top[1].lean, Lean::Bearish);
    EXPECT_FALSE(top[1].glow);

    EXPECT_EQ(top[2].symbol, "GME");
    EXPECT_DOUBLE_EQ(top[2].bullish_ratio, 0.5);
    EXPECT_EQ(top[2].lean, Lean::Neutral);
}

TEST(SentimentTally, BullishLeanWhenNotContested) {
    SentimentTally t{.bullish = 5, .bearish = 2, .neutral = 9};
    EXPECT_FALSE(t.contested());
    EXPECT_EQ(t.lean(), Lean::Bullish);
    EXPECT_EQ(color_for(t.lean()), Rgb{0x22c55e});
}

// ─── Questions ───────────────────────────────────────────────────────────────

TEST(EventAggregator, QuestionsWithSameTopicMerge) {
    EventAggregator agg;
    (void)agg.on_message(question("AAPL", "earnings when?", "a"), 1'000);
    (void)agg.on_message(question("AAPL", "is AAPL a buy?", "b"), 2'000);

    ASSERT_EQ(agg.questions().size(), 1u);
    const auto& q = agg.questions().front();
    EXPECT_EQ(q.count, 2u);
    EXPECT_EQ(q.text, "is AAPL a buy?");
    EXPECT_EQ(q.author, "b");
    EXPECT_EQ(q.time, 2'000);
    EXPECT_EQ(q.topic, "AAPL");
}

TEST(EventAggregator, TopiclessQuestionsKeyOnTextPrefix) {
    EventAggregator agg;
    const std::string base(30, 'x');
    (void)agg.on_message(question(std::nullopt, base + " first"), 0);
    (void)agg.on_message(question(std::nullopt, base + " second"), 1);
    (void)agg.on_message(question(std::nullopt, "something else?"), 2);

    ASSERT_EQ(agg.questions().size(), 2u);
    EXPECT_EQ(agg.questions()[0].count, 2u);
    EXPECT_EQ(agg.questions()[0].topic, "GENERAL");
    EXPECT_EQ(agg.questions()[1].count, 1u);
}

TEST(EventAggregator, QuestionKeyCountsCodePoints) {
    // 30 two-byte code points followed by a differing tail.
    std::string text;
    for (int i = 0; i < 31; ++i) text += "é";
    const auto key = EventAggregator::question_key(std::nullopt, text);
    EXPECT_EQ(key.size(), 60u);
    EXPECT_EQ(EventAggregator::question_key(std::string("SOL"), text), "SOL");
}

TEST(EventAggregator, QuestionTtlPresentAt29sAbsentAt31s) {
    EventAggregator agg;
    const TimestampMs T = 100'000;
    (void)agg.on_message(question("AAPL", "why red?"), T);

    EXPECT_EQ(agg.active_questions(T + 29'000).size(), 1u);
    EXPECT_EQ(agg.sweep_expired_questions(T + 29'000), 0u);

    EXPECT_TRUE(agg.active_questions(T + 31'000).empty());
    EXPECT_EQ(agg.sweep_expired_questions(T + 31'000), 1u);
    EXPECT_TRUE(agg.questions().empty());
}

TEST(EventAggregator, MergeRefreshesQuestionTtl) {
    EventAggregator agg;
    (void)agg.on_message(question("BTC", "moon?"), 0);
    (void)agg.on_message(question("BTC", "moon??"), 20'000);
    EXPECT_EQ(agg.active_questions(45'000).size(), 1u);
}

TEST(EventAggregator, QuestionCapDropsOldest) {
    EventAggregator agg;
    for (int i = 0; i < 10; ++i) {
        (void)agg.on_message(question("T" + std::to_string(i), "q?"), i);
    }
    ASSERT_EQ(agg.questions().size(), constants::MAX_QUESTIONS);
    EXPECT_EQ(agg.questions().front().key, "T2");
    EXPECT_EQ(agg.questions().back().key, "T9");
}

// ─── Pulses and vibes ────────────────────────────────────────────────────────

TEST(EventAggregator, PulsesNewestFirstAndCapped) {
    EventAggregator agg;
    for (int i = 0; i < 9; ++i) {
        PulseEvent p{.summary = "s" + std::to_string(i), .mood = "calm", .top_ticker = std::nullopt};
        ASSERT_EQ(agg.on_pulse(p, i), IngestStatus::Accepted);
    }
    ASSERT_EQ(agg.pulses().size(), constants::MAX_PULSES);
    EXPECT_EQ(agg.pulses().front().summary, "s8");
    EXPECT_EQ(agg.pulses().back().summary, "s2");
}

TEST(EventAggregator, EmptyTickerIsAbsent) {
    EventAggregator agg;
    (void)agg.on_pulse(PulseEvent{.summary = "x", .mood = "hype", .top_ticker = ""}, 0);
    EXPECT_FALSE(agg.pulses().front().top_ticker.has_value());
}

TEST(EventAggregator, ReleasedVibesCapKeepsNewest) {
    EventAggregator agg;
    for (int i = 0; i < 20; ++i) {
        agg.push_released_vibe(ReleasedVibe{.text = std::to_string(i),
                                            .kind = VibeKind::Funny,
                                            .released_at = i});
    }
    ASSERT_EQ(agg.released_vibes().size(), constants::MAX_RELEASED_VIBES);
    EXPECT_EQ(agg.released_vibes().front().text, "4");
    EXPECT_EQ(agg.released_vibes().back().text, "19");
}

// ─── Rejection ───────────────────────────────────────────────────────────────

TEST(EventAggregator, RejectsInvalidEventsWithoutMutation) {
    EventAggregator agg;
    EXPECT_EQ(agg.on_message(msg("AAPL", Sentiment::Bullish, ""), 0), IngestStatus::MissingText);
    EXPECT_EQ(agg.on_pulse(PulseEvent{.summary = "", .mood = "m", .top_ticker = {}}, 0),
              IngestStatus::MissingSummary);
    EXPECT_EQ(agg.on_vibe(VibeEvent{.kind = std::nullopt, .text = "lol"}),
              IngestStatus::UnknownVibeKind);
    EXPECT_EQ(agg.on_vibe(VibeEvent{.kind = VibeKind::Funny, .text = ""}),
              IngestStatus::MissingText);

    EXPECT_EQ(agg.topic_count(), 0u);
    EXPECT_TRUE(agg.pulses().empty());
    EXPECT_DOUBLE_EQ(agg.current_rate(1), 0.0);
}

TEST(EventAggregator, ClearResetsEverything) {
    EventAggregator agg;
    (void)agg.on_message(question("AAPL", "?"), 0);
    (void)agg.on_pulse(PulseEvent{.summary = "x", .mood = "m", .top_ticker = {}}, 0);
    agg.clear();
    EXPECT_EQ(agg.topic_count(), 0u);
    EXPECT_TRUE(agg.questions().empty());
    EXPECT_TRUE(agg.pulses().empty());
    EXPECT_TRUE(agg.top_topics(5).empty());
}

// ─── Wire labels ─────────────────────────────────────────────────────────────

TEST(WireLabels, ParseIsCaseInsensitiveAndTrimmed) {
    EXPECT_EQ(parse_sentiment(" Bullish "), Sentiment::Bullish);
    EXPECT_EQ(parse_sentiment("BEARISH"), Sentiment::Bearish);
    EXPECT_FALSE(parse_sentiment("moon").has_value());
    EXPECT_EQ(parse_vibe_kind("Uplifting"), VibeKind::Uplifting);
    EXPECT_FALSE(parse_vibe_kind("sad").has_value());
}
