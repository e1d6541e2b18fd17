#pragma once

/// @file include/chatviz/layout.hpp
/// @brief BubbleLayoutSimulator: force-directed layout of topic bubbles.
///
/// # Module: Layout
///
/// ## Responsibility
/// Position up to `max_visible` topic bubbles inside a bounded rectangle so
/// that popularity is legible (bigger, more central) while the motion stays
/// organic (never static, never chaotic).
///
/// ## Forces (per bubble i, per frame)
///   p         = mass_i / max_mass                         (popularity ∈ [0,1])
///   center    = gravity · (0.5 + 2p) · center_pull_multiplier   toward center
///   orbit     = orbit_tendency · (0.5 − 0.2p)                  tangential
///   drift     = drift_strength · (1.5 − p) · U(−½, ½)          per axis
///   attract   = mass_attraction · (m_j − m_i)   toward every heavier j in cutoff
///   collision = collision_response · overlap^softness          away from j
///
/// followed by speed clamping, multiplicative damping, integration and an
/// inelastic bounce at the boundary box.
///
/// ## Complexity
/// O(n²) per frame. With n ≤ 24 this is cheaper than maintaining a spatial
/// index; a much larger n needs a spatial partition.
///
/// ## Guarantees
/// - After `sync` and after every `step`, each bubble centre lies in
///   [r + margin, extent − r − margin] on both axes (or on the midline when
///   the extent is smaller than the bubble).
/// - A bubble exists iff its topic is in the last synced ranking.
/// - Deterministic for a given seed and call sequence.

#include "chatviz/types.hpp"
#include "chatviz/constants.hpp"
#include "chatviz/aggregator.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chatviz::layout {

// ─── SizeCurve ───────────────────────────────────────────────────────────────

/// Mapping from count ratio to bubble size.
enum class SizeCurve {
    Linear,  ///< min + r·(max − min)       (2D panel)
    Sqrt,    ///< min + √r·(max − min)      (3D orb styling)
};

// ─── LayoutConfig ────────────────────────────────────────────────────────────

/// Immutable physics and geometry tuning of one simulator.
struct LayoutConfig {
    // Geometry
    double      width       = 400.0;
    double      height      = 600.0;
    std::size_t max_visible = constants::MAX_VISIBLE_TOPICS;

    // Sizing (diameters)
    double    min_size   = 45.0;
    double    max_size   = 140.0;
    SizeCurve size_curve = SizeCurve::Linear;

    // Center pull
    double gravity_strength       = 0.00004;
    double center_pull_multiplier = 0.3;
    double center_epsilon         = 1.0;

    // Orbit and drift
    double orbit_tendency   = 0.03;
    double orbit_min_radius = 20.0;
    double drift_strength   = 0.025;

    // Mass attraction
    double mass_attraction   = 0.00003;
    double attraction_cutoff = 200.0;

    // Soft collision
    double collision_response = 0.06;
    double collision_softness = 0.5;
    double collision_padding  = 8.0;

    // Integration
    double max_velocity = 1.8;
    double damping      = 0.96;

    // Boundary
    double boundary_margin    = 10.0;
    double bounce_restitution = 0.3;

    // Spawn
    double spawn_distance_min = 80.0;
    double spawn_distance_max = 130.0;
    double spawn_velocity     = 0.15;

    std::uint64_t seed = 0xb0bb'1e5ULL;

    /// Check ranges (positive extents, min ≤ max, damping in (0,1], …).
    ///
    /// # Returns
    /// `nullopt` when valid, otherwise a description of the first problem.
    [[nodiscard]] std::optional<std::string> validate() const;
};

// ─── Bubble ──────────────────────────────────────────────────────────────────

/// Ephemeral physical state of one visible topic.
struct Bubble {
    std::string   symbol;
    Vec2          position;
    Vec2          velocity;
    double        radius;
    double        mass;          ///< mirrors the topic count
    bool          just_updated;  ///< spawned or grew since the last acknowledge_updates()
};

// ─── BubbleLayoutSimulator ───────────────────────────────────────────────────

class BubbleLayoutSimulator {
public:
    explicit BubbleLayoutSimulator(LayoutConfig config = LayoutConfig{});

    /// Reconcile physics state with a ranking (already truncated to the
    /// visible set; entries beyond `max_visible` are ignored).
    ///
    /// New symbols spawn near the centre, known symbols get a new radius and
    /// mass, symbols not in `ranked` are destroyed. `just_updated` is set on
    /// spawn and on growth and stays set until `acknowledge_updates`.
    void sync(std::span<const aggregator::RankedTopic> ranked);

    /// Advance the simulation by one animation frame.
    void step();

    /// Resize the layout region; bubbles are re-clamped into the new box.
    void set_extent(double width, double height);

    /// Clear `just_updated` on every bubble once the renderer has pulsed them.
    void acknowledge_updates() noexcept;

    /// Destroy all physics state.
    void clear() noexcept;

    [[nodiscard]] const Bubble* bubble(std::string_view symbol) const noexcept;

    /// Bubbles in the order of the last sync (rank order).
    [[nodiscard]] const std::vector<Bubble>& bubbles() const noexcept { return bubbles_; }

    [[nodiscard]] std::size_t size() const noexcept { return bubbles_.size(); }

    [[nodiscard]] bool empty() const noexcept { return bubbles_.empty(); }

    [[nodiscard]] const LayoutConfig& config() const noexcept { return config_; }

    [[nodiscard]] Vec2 center() const noexcept { return Vec2(width_ * 0.5, height_ * 0.5); }

    [[nodiscard]] double width() const noexcept { return width_; }
    [[nodiscard]] double height() const noexcept { return height_; }

    /// Largest mass among visible bubbles (at least 1).
    [[nodiscard]] double max_mass() const noexcept;

    // ── Pure tuning functions ────────────────────────────────────────────────

    /// Diameter for a count ratio in [0,1] (ratio is clamped).
    [[nodiscard]] static double size_for_ratio(double ratio, const LayoutConfig& cfg) noexcept;

    /// Magnitude of the centre pull for a popularity p.
    [[nodiscard]] static double center_pull_coefficient(double popularity,
                                                        const LayoutConfig& cfg) noexcept;

    /// Magnitude of the tangential orbit force for a popularity p.
    [[nodiscard]] static double orbit_coefficient(double popularity,
                                                  const LayoutConfig& cfg) noexcept;

    /// Amplitude of the random drift for a popularity p.
    [[nodiscard]] static double drift_coefficient(double popularity,
                                                  const LayoutConfig& cfg) noexcept;

private:
    [[nodiscard]] Bubble spawn(const aggregator::RankedTopic& topic, std::size_t index,
                               std::size_t total, double radius);
    void clamp_to_bounds(Bubble& b) const noexcept;

    LayoutConfig                           config_;
    double                                 width_;
    double                                 height_;
    std::vector<Bubble>                    bubbles_;
    std::mt19937_64                        rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

} // namespace chatviz::layout
