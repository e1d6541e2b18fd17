/**
 * @file  fuzz_event_log.cpp
 * @brief libFuzzer target for EventLog parsing and Engine ingestion
 *
 * Build:
 *   cmake -DCHATVIZ_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_event_log
 *
 * Run for 60 seconds:
 *   ./fuzz_event_log -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every parsed event is either accepted or rejected with a status;
 *      rejected events leave the topic count unchanged.
 *   3. After replay and drain, the vibe queue is empty and the pacer idle.
 *   4. Every bubble stays inside the layout box.
 *
 * Fuzzer strategy:
 *   Input is passed directly as log text. The parser must handle binary
 *   garbage, missing tabs, huge or negative timestamps, CR/LF mixes and
 *   invalid UTF-8 in free-text fields (question keys truncate by code point).
 */

#include <cassert>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "chatviz/engine.hpp"
#include "chatviz/event_log.hpp"

using namespace chatviz;
using namespace chatviz::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto events = EventLog::parse_string(input);

    Engine engine;
    TimestampMs clock = 0;
    for (const auto& ev : events) {
        // Clamp the clock so pathological timestamps cannot overflow arithmetic.
        clock = std::max<TimestampMs>(clock, std::clamp<TimestampMs>(ev.at, 0, 1'000'000'000));

        const auto before = engine.aggregate().topic_count();
        const auto status = engine.handle(ev.event, clock);
        if (status != IngestStatus::Accepted) {
            assert(engine.aggregate().topic_count() == before);
        }
        engine.tick(clock);
        engine.advance_frame();
    }

    // Invariant 3: drain terminates.
    const std::size_t budget = engine.drip().queue_length() + 2;
    for (std::size_t i = 0; i < budget; ++i) {
        const auto at = engine.drip().next_fire_time();
        if (!at) break;
        engine.tick(*at);
    }
    assert(engine.drip().queue_length() == 0);
    assert(engine.drip().state() == pacer::VibePacer::LoopState::Idle);

    // Invariant 4: containment.
    const auto& sim = engine.simulator();
    const double m = sim.config().boundary_margin;
    for (const auto& b : sim.bubbles()) {
        assert(std::isfinite(b.position.x()) && std::isfinite(b.position.y()));
        assert(b.position.x() >= b.radius + m - 1e-9);
        assert(b.position.x() <= sim.width() - b.radius - m + 1e-9);
        assert(b.position.y() >= b.radius + m - 1e-9);
        assert(b.position.y() <= sim.height() - b.radius - m + 1e-9);
        (void)b;
    }
    (void)m;

    return 0;
}
