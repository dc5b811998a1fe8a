/**
 * @file intersection.cpp
 * @brief Orbit crossing and closest-approach detection
 */

#include "conics/orbital/intersection.h"
#include "conics/core/constants.h"
#include "conics/core/logger.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace conics::orbital {

const char* encounter_kind_name(EncounterKind kind)
{
    switch (kind) {
        case EncounterKind::Approaching:     return "approaching";
        case EncounterKind::Receding:        return "receding";
        case EncounterKind::ClosestApproach: return "closest-approach";
    }
    return "unknown";
}

// ============================================================================
// Geometry
// ============================================================================

SegmentApproach closest_approach(const Vec3& ship_p1, const Vec3& ship_p2,
                                 const Vec3& body_p1, const Vec3& body_p2)
{
    Vec3 W = ship_p1 - body_p1;
    Vec3 ship_delta = ship_p2 - ship_p1;
    Vec3 body_delta = body_p2 - body_p1;
    Vec3 V = ship_delta - body_delta;

    SegmentApproach result;
    Real vv = V.dot(V);
    if (vv >= constants::CLOSEST_APPROACH_EPSILON) {
        result.s = std::clamp(-W.dot(V) / vv, 0.0, 1.0);
    }
    result.ship_position = ship_p1 + ship_delta * result.s;
    result.body_position = body_p1 + body_delta * result.s;
    result.distance = (result.ship_position - result.body_position).length();
    return result;
}

Real radius_crossing(Real r1, Real r2, Real target)
{
    bool crosses = (r1 <= target && r2 >= target) || (r1 >= target && r2 <= target);
    if (!crosses) {
        return -1.0;
    }
    if (r1 == r2) {
        return 0.5;
    }
    return std::clamp((target - r1) / (r2 - r1), 0.0, 1.0);
}

// ============================================================================
// IntersectionDetector
// ============================================================================

IntersectionDetector::IntersectionDetector(IntersectionSettings settings)
    : settings_(settings)
{
}

std::vector<Real> IntersectionDetector::target_radii(const OrbitalElements& elements) const
{
    Real a = elements.semi_major_axis();
    Real e = elements.eccentricity();
    std::vector<Real> radii{a};
    if (e > settings_.eccentricity_threshold && !elements.is_hyperbolic()) {
        Real perihelion = a * (1.0 - e);
        Real aphelion = a * (1.0 + e);
        if (std::abs(perihelion - a) > settings_.radius_separation) {
            radii.push_back(perihelion);
        }
        if (std::abs(aphelion - a) > settings_.radius_separation) {
            radii.push_back(aphelion);
        }
    }
    return radii;
}

IntersectionReport IntersectionDetector::detect(const Trajectory& trajectory,
                                                const bodies::BodyCatalog& catalog,
                                                const std::vector<BodyId>& bodies,
                                                Real reference_time) const
{
    using Clock = std::chrono::steady_clock;
    auto started = Clock::now();

    IntersectionReport report;
    report.trajectory_hash = trajectory.hash;
    const auto& samples = trajectory.samples;
    if (samples.size() < 2) {
        return report;
    }

    // In an SOI only the SOI body is examined
    const Frame& frame = samples.front().state.frame;
    BodyId primary = catalog.primary();

    for (BodyId id : bodies) {
        std::chrono::duration<Real, std::milli> elapsed = Clock::now() - started;
        if (elapsed.count() > settings_.time_budget_ms) {
            report.partial = true;
            Logger::debug("Intersection search over budget after {:.2f} ms", elapsed.count());
            break;
        }

        const bodies::Body* body = catalog.find(id);
        if (!body || !body->elements || body->parent != primary) {
            continue;
        }
        if (!frame.is_heliocentric() && frame.body != id) {
            continue;
        }

        std::vector<Vec3> body_positions;
        body_positions.reserve(samples.size());
        for (const auto& sample : samples) {
            body_positions.push_back(catalog.heliocentric_state(id, sample.time).position);
        }

        Vec3 normal = body->elements->orbit_normal();
        auto make_event = [&](Real time, const Vec3& ship, const Vec3& target) {
            IntersectionEvent event;
            event.body = id;
            event.body_name = body->name;
            event.time = time;
            event.ship_position = ship;
            event.body_position = target;
            Vec3 separation = ship - target;
            event.distance = separation.length();
            Real along_normal = separation.dot(normal);
            event.out_of_plane_distance = std::abs(along_normal);
            event.in_plane_distance = (separation - normal * along_normal).length();
            return event;
        };

        std::vector<Real> radii = target_radii(*body->elements);
        std::unordered_set<Int64> seen;
        SegmentApproach best;
        Real best_time = 0.0;
        best.distance = std::numeric_limits<Real>::infinity();

        for (SizeT i = 0; i + 1 < samples.size(); ++i) {
            const auto& p1 = samples[i];
            const auto& p2 = samples[i + 1];
            if (p2.time < reference_time) {
                continue;
            }

            Real r1 = p1.helio_position.length();
            Real r2 = p2.helio_position.length();
            Vec3 W = p1.helio_position - body_positions[i];
            Vec3 V = (p2.helio_position - p1.helio_position) - (body_positions[i + 1] - body_positions[i]);

            for (Real radius : radii) {
                Real s = radius_crossing(r1, r2, radius);
                if (s < 0.0) {
                    continue;
                }
                Real time = p1.time + s * (p2.time - p1.time);
                auto key = static_cast<Int64>(std::llround(time / settings_.time_rounding));
                if (!seen.insert(key).second) {
                    continue;
                }

                Vec3 ship = math::lerp(p1.helio_position, p2.helio_position, s);
                Vec3 target = catalog.heliocentric_state(id, time).position;
                if (!target.is_finite()) {
                    continue;
                }

                IntersectionEvent event = make_event(time, ship, target);
                event.target_radius = radius;
                // d|W + sV|^2/ds sign at the crossing
                Real rate = (W + V * s).dot(V);
                event.kind = rate < 0.0 ? EncounterKind::Approaching : EncounterKind::Receding;
                report.events.push_back(std::move(event));
            }

            if (settings_.closest_approach) {
                SegmentApproach approach = closest_approach(p1.helio_position, p2.helio_position,
                                                            body_positions[i], body_positions[i + 1]);
                if (approach.distance < best.distance) {
                    best = approach;
                    best_time = p1.time + approach.s * (p2.time - p1.time);
                }
            }
        }

        if (settings_.closest_approach && std::isfinite(best.distance)) {
            IntersectionEvent event = make_event(best_time, best.ship_position, best.body_position);
            event.kind = EncounterKind::ClosestApproach;
            report.events.push_back(std::move(event));
        }
    }

    std::sort(report.events.begin(), report.events.end(),
              [](const IntersectionEvent& a, const IntersectionEvent& b) {
                  if (a.time != b.time) {
                      return a.time < b.time;
                  }
                  if (a.body_name != b.body_name) {
                      return a.body_name < b.body_name;
                  }
                  return a.kind < b.kind;
              });
    report.total_found = report.events.size();
    if (report.events.size() > static_cast<SizeT>(settings_.max_results)) {
        report.truncated = true;
        Logger::debug("Intersection results capped at {} of {}", settings_.max_results,
                      report.total_found);
        report.events.resize(static_cast<SizeT>(settings_.max_results));
    }
    return report;
}

std::shared_ptr<const IntersectionReport> IntersectionDetector::detect(
    const Trajectory& trajectory, const bodies::BodyCatalog& catalog,
    const std::vector<BodyId>& bodies, Real reference_time, IntersectionCache& cache) const
{
    HashBuilder key;
    key.add(trajectory.hash).add(reference_time, constants::TIME_ROUNDING);
    for (BodyId id : bodies) {
        key.add(static_cast<UInt64>(id));
    }
    if (auto cached = cache.find(key.value())) {
        return cached;
    }
    return cache.store(key.value(), detect(trajectory, catalog, bodies, reference_time));
}

} // namespace conics::orbital
