/// @file src/layout/bubble_layout.cpp
/// @brief BubbleLayoutSimulator: spawn, reconcile and integrate topic bubbles.

#include "chatviz/layout.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <utility>

namespace chatviz::layout {

namespace {

/// Clamp one axis into [lo, hi] with an inelastic bounce. When the box is
/// narrower than the bubble the coordinate is pinned to the midline.
void bounce_axis(double& pos, double& vel, double radius, double extent,
                 const LayoutConfig& cfg) noexcept {
    const double lo = radius + cfg.boundary_margin;
    const double hi = extent - radius - cfg.boundary_margin;
    if (lo > hi) {
        pos = extent * 0.5;
        vel = 0.0;
        return;
    }
    if (pos < lo) {
        pos = lo;
        vel *= -cfg.bounce_restitution;
    } else if (pos > hi) {
        pos = hi;
        vel *= -cfg.bounce_restitution;
    }
}

[[nodiscard]] bool finite_positive(double v) noexcept {
    return std::isfinite(v) && v > 0.0;
}

} // anonymous namespace

// ─── LayoutConfig::validate ──────────────────────────────────────────────────

std::optional<std::string> LayoutConfig::validate() const {
    if (!finite_positive(width) || !finite_positive(height))
        return "layout extent must be positive";
    if (max_visible == 0)
        return "max_visible must be at least 1";
    if (!finite_positive(min_size) || !std::isfinite(max_size) || min_size > max_size)
        return "bubble sizes must satisfy 0 < min_size <= max_size";
    if (!(damping > 0.0 && damping <= 1.0))
        return "damping must lie in (0, 1]";
    if (!finite_positive(max_velocity))
        return "max_velocity must be positive";
    if (!finite_positive(collision_softness))
        return "collision_softness must be positive";
    if (!(bounce_restitution >= 0.0 && bounce_restitution <= 1.0))
        return "bounce_restitution must lie in [0, 1]";
    if (!(spawn_distance_min >= 0.0 && spawn_distance_min <= spawn_distance_max))
        return "spawn distances must satisfy 0 <= min <= max";
    if (!std::isfinite(gravity_strength) || !std::isfinite(orbit_tendency) ||
        !std::isfinite(drift_strength) || !std::isfinite(mass_attraction) ||
        !std::isfinite(collision_response) || !std::isfinite(boundary_margin))
        return "force constants must be finite";
    return std::nullopt;
}

// ─── Construction ────────────────────────────────────────────────────────────

BubbleLayoutSimulator::BubbleLayoutSimulator(LayoutConfig config)
    : config_(std::move(config))
    , width_(config_.width)
    , height_(config_.height)
    , rng_(config_.seed)
{}

// ─── Pure tuning functions ───────────────────────────────────────────────────

double BubbleLayoutSimulator::size_for_ratio(double ratio, const LayoutConfig& cfg) noexcept {
    const double r = std::isfinite(ratio) ? std::clamp(ratio, 0.0, 1.0) : 0.0;
    const double t = cfg.size_curve == SizeCurve::Sqrt ? std::sqrt(r) : r;
    return cfg.min_size + t * (cfg.max_size - cfg.min_size);
}

double BubbleLayoutSimulator::center_pull_coefficient(double popularity,
                                                      const LayoutConfig& cfg) noexcept {
    return cfg.gravity_strength * (0.5 + 2.0 * popularity) * cfg.center_pull_multiplier;
}

double BubbleLayoutSimulator::orbit_coefficient(double popularity,
                                                const LayoutConfig& cfg) noexcept {
    return cfg.orbit_tendency * (0.5 - 0.2 * popularity);
}

double BubbleLayoutSimulator::drift_coefficient(double popularity,
                                                const LayoutConfig& cfg) noexcept {
    return cfg.drift_strength * (1.5 - popularity);
}

double BubbleLayoutSimulator::max_mass() const noexcept {
    double m = 1.0;
    for (const auto& b : bubbles_) {
        m = std::max(m, b.mass);
    }
    return m;
}

// ─── sync ────────────────────────────────────────────────────────────────────

void BubbleLayoutSimulator::sync(std::span<const aggregator::RankedTopic> ranked) {
    if (ranked.size() > config_.max_visible) {
        ranked = ranked.first(config_.max_visible);
    }

    std::uint64_t max_count = 1;
    for (const auto& t : ranked) {
        max_count = std::max(max_count, t.count);
    }

    std::vector<Bubble> next;
    next.reserve(ranked.size());
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        const auto& topic = ranked[i];
        const double ratio  = static_cast<double>(topic.count) / static_cast<double>(max_count);
        const double radius = size_for_ratio(ratio, config_) * 0.5;
        const double mass   = static_cast<double>(topic.count);

        auto it = std::find_if(bubbles_.begin(), bubbles_.end(),
                               [&](const Bubble& b) { return b.symbol == topic.symbol; });
        if (it == bubbles_.end()) {
            next.push_back(spawn(topic, i, ranked.size(), radius));
            continue;
        }

        Bubble b       = std::move(*it);
        b.just_updated = b.just_updated || mass > b.mass;
        b.radius       = radius;
        b.mass         = mass;
        clamp_to_bounds(b);
        next.push_back(std::move(b));
    }

    // Bubbles left behind in bubbles_ fell out of the visible set.
    bubbles_ = std::move(next);
}

Bubble BubbleLayoutSimulator::spawn(const aggregator::RankedTopic& topic, std::size_t index,
                                    std::size_t total, double radius) {
    const double n     = static_cast<double>(std::max<std::size_t>(total, 1));
    const double theta = 2.0 * std::numbers::pi * static_cast<double>(index) / n
                       + unit_(rng_) * 0.5;
    const double dist  = config_.spawn_distance_min
                       + unit_(rng_) * (config_.spawn_distance_max - config_.spawn_distance_min);

    const double vx = (unit_(rng_) - 0.5) * config_.spawn_velocity;
    const double vy = (unit_(rng_) - 0.5) * config_.spawn_velocity;

    Bubble b{
        .symbol       = topic.symbol,
        .position     = center() + Vec2(std::cos(theta), std::sin(theta)) * dist,
        .velocity     = Vec2(vx, vy),
        .radius       = radius,
        .mass         = static_cast<double>(topic.count),
        .just_updated = true,
    };
    clamp_to_bounds(b);
    spdlog::debug("layout: spawned {} at ({:.1f}, {:.1f}) r={:.1f}",
                  b.symbol, b.position.x(), b.position.y(), b.radius);
    return b;
}

// ─── step ────────────────────────────────────────────────────────────────────

void BubbleLayoutSimulator::step() {
    if (bubbles_.empty()) {
        return;
    }

    const Vec2   c      = center();
    const double m_max  = max_mass();
    const std::size_t n = bubbles_.size();

    // Forces are evaluated against start-of-frame positions.
    std::vector<Vec2> force(n, Vec2::Zero());

    for (std::size_t i = 0; i < n; ++i) {
        const Bubble& bi = bubbles_[i];
        const double  p  = bi.mass / m_max;

        // ── Center pull and orbit ────────────────────────────────────────────
        const Vec2   to_center = c - bi.position;
        const double dist_c    = to_center.norm();
        if (dist_c > config_.center_epsilon) {
            force[i] += to_center / dist_c * center_pull_coefficient(p, config_);
        }
        if (dist_c > config_.orbit_min_radius) {
            const Vec2 tangent(-to_center.y(), to_center.x());
            force[i] += tangent / dist_c * orbit_coefficient(p, config_);
        }

        // ── Drift ────────────────────────────────────────────────────────────
        const double amp = drift_coefficient(p, config_);
        force[i] += Vec2(unit_(rng_) - 0.5, unit_(rng_) - 0.5) * amp;

        // ── Pairwise: mass attraction and soft collision ─────────────────────
        for (std::size_t j = 0; j < n; ++j) {
            if (j == i) continue;
            const Bubble& bj   = bubbles_[j];
            const Vec2    d    = bj.position - bi.position;
            const double  dist = d.norm();
            if (dist <= 0.0) continue;

            if (bj.mass > bi.mass && dist < config_.attraction_cutoff) {
                force[i] += d / dist * (config_.mass_attraction * (bj.mass - bi.mass));
            }

            const double min_dist = bi.radius + bj.radius + config_.collision_padding;
            if (dist < min_dist) {
                const double overlap = (min_dist - dist) / min_dist;
                const double push = std::pow(overlap, config_.collision_softness)
                                  * config_.collision_response;
                force[i] -= d / dist * push;
            }
        }
    }

    for (std::size_t i = 0; i < n; ++i) {
        Bubble& b = bubbles_[i];
        b.velocity += force[i];

        const double speed = b.velocity.norm();
        if (speed > config_.max_velocity) {
            b.velocity *= config_.max_velocity / speed;
        }
        b.velocity *= config_.damping;
        b.position += b.velocity;

        clamp_to_bounds(b);
    }
}

// ─── Extent and teardown ─────────────────────────────────────────────────────

void BubbleLayoutSimulator::clamp_to_bounds(Bubble& b) const noexcept {
    bounce_axis(b.position.x(), b.velocity.x(), b.radius, width_, config_);
    bounce_axis(b.position.y(), b.velocity.y(), b.radius, height_, config_);
}

void BubbleLayoutSimulator::set_extent(double width, double height) {
    if (!finite_positive(width) || !finite_positive(height)) {
        spdlog::warn("layout: ignoring invalid extent {}x{}", width, height);
        return;
    }
    width_  = width;
    height_ = height;
    for (auto& b : bubbles_) {
        clamp_to_bounds(b);
    }
}

void BubbleLayoutSimulator::acknowledge_updates() noexcept {
    for (auto& b : bubbles_) {
        b.just_updated = false;
    }
}

void BubbleLayoutSimulator::clear() noexcept {
    bubbles_.clear();
}

const Bubble* BubbleLayoutSimulator::bubble(std::string_view symbol) const noexcept {
    for (const auto& b : bubbles_) {
        if (b.symbol == symbol) {
            return &b;
        }
    }
    return nullptr;
}

} // namespace chatviz::layout
