/**
 * @file engine_exec.cpp
 * @brief Engine facade implementation
 *
 * Owns the clock, bodies, ships and per-ship query caches, and drives the
 * per-tick ship step through a single advance() entry point.
 */

#include "conics/interface/api.h"
#include "conics/core/time.h"
#include <cmath>
#include <map>
#include <stdexcept>

namespace conics {

const char* advance_result_name(AdvanceResult result)
{
    switch (result) {
        case AdvanceResult::Ok:             return "ok";
        case AdvanceResult::NotInitialized: return "not-initialized";
        case AdvanceResult::Paused:         return "paused";
        case AdvanceResult::InvalidStep:    return "invalid-step";
        case AdvanceResult::Reentrant:      return "reentrant";
        case AdvanceResult::NonFiniteState: return "non-finite-state";
    }
    return "unknown";
}

// ============================================================================
// Engine Implementation
// ============================================================================

class EngineImpl {
public:
    EngineImpl() = default;
    ~EngineImpl() = default;

    bool initialize(const std::string& config_path)
    {
        try {
            config::ConfigLoader loader;
            return initialize_with_config(loader.load_engine_config(config_path));
        } catch (const std::exception& e) {
            Logger::warn("Engine config '{}' not loaded ({}); using defaults", config_path, e.what());
            return initialize_with_config(config::EngineConfig::defaults());
        }
    }

    bool initialize_with_config(const config::EngineConfig& cfg)
    {
        config_ = cfg;
        Logger::init(cfg.log_output, cfg.log_level, cfg.log_directory);

        bodies::BodyCatalog catalog = bodies::BodyCatalog::solar_system();
        if (!cfg.bodies_file.empty()) {
            try {
                config::ConfigLoader loader;
                catalog = loader.load_body_catalog(cfg.bodies_file);
            } catch (const std::exception& e) {
                Logger::warn("Body catalog '{}' not loaded ({}); using the solar system",
                             cfg.bodies_file, e.what());
            }
        }
        set_bodies(std::move(catalog));

        time_manager_.initialize(cfg.start_epoch, cfg.time_step);
        time_manager_.set_time_scale(cfg.time_scale);

        propagator_ = orbital::ShipPropagator(cfg.physics);
        predictor_ = std::make_unique<orbital::TrajectoryPredictor>(propagator_, cfg.prediction);
        detector_ = orbital::IntersectionDetector(cfg.intersection);

        ships_.clear();
        next_ship_id_ = 0;
        initialized_ = true;
        state_ = SimulationState::Initialized;

        Logger::info("Engine initialized at JD {:.3f} with {} bodies", cfg.start_epoch, catalog_.size());
        return true;
    }

    void shutdown()
    {
        if (initialized_) {
            dispatcher_.dispatch(events::Event::create_system(events::EventType::SimulationStopped,
                                                              time_manager_.get_time()));
        }
        ships_.clear();
        predictor_.reset();
        dispatcher_.clear_queue();
        initialized_ = false;
        state_ = SimulationState::Uninitialized;
        Logger::shutdown();
    }

    bool is_initialized() const { return initialized_; }
    const config::EngineConfig& get_config() const { return config_; }

    // ========================================================================
    // Stepping
    // ========================================================================

    AdvanceResult advance(Real dt)
    {
        if (!initialized_) {
            return AdvanceResult::NotInitialized;
        }
        if (advancing_) {
            Logger::warn("Re-entrant advance({}) rejected", dt);
            dispatcher_.queue(events::Event::create_diagnostic(
                events::EventType::AdvanceRejected, INVALID_SHIP_ID, "", "re-entrant advance", dt,
                time_manager_.get_time()));
            return AdvanceResult::Reentrant;
        }
        if (!std::isfinite(dt) || dt <= 0.0) {
            return AdvanceResult::InvalidStep;
        }
        if (state_ == SimulationState::Paused || state_ == SimulationState::Stopped ||
            time_manager_.is_paused()) {
            return AdvanceResult::Paused;
        }

        AdvanceGuard guard(advancing_);

        if (state_ == SimulationState::Initialized) {
            start();
        }

        Real t0 = time_manager_.get_time();
        Real simulated = time_manager_.advance(dt);
        if (simulated <= 0.0) {
            return AdvanceResult::Paused;
        }

        orbital::SimulationContext ctx;
        ctx.time = t0;
        ctx.catalog = &catalog_;
        ctx.soi_candidates = soi_candidates_;

        // Step every ship against the start-of-tick state, then commit
        std::vector<events::Event> pending;
        bool any_failed = false;
        std::map<ShipId, orbital::StepResult> results;
        for (const auto& [id, record] : ships_) {
            results.emplace(id, propagator_.step(record.ship, ctx, simulated, record.command));
        }

        for (auto& [id, result] : results) {
            ShipRecord& record = ships_.at(id);
            if (result.status != orbital::StepStatus::Ok) {
                any_failed = true;
                Logger::warn("Ship '{}' step failed: {}", record.ship.name,
                             orbital::step_status_name(result.status));
                pending.push_back(events::Event::create_diagnostic(
                    events::EventType::NonFiniteState, id, record.ship.name,
                    orbital::step_status_name(result.status), simulated, t0 + simulated));
                continue;
            }

            collect_events(id, record, result, pending);
            record.ship = std::move(result.ship);
        }

        for (auto& event : pending) {
            event.base.tick = time_manager_.get_step_count();
            dispatcher_.dispatch(event);
        }
        dispatcher_.dispatch(events::Event::create_time_step(dt, simulated, ships_.size(),
                                                             time_manager_.get_time()));
        dispatcher_.flush_queue();

        return any_failed ? AdvanceResult::NonFiniteState : AdvanceResult::Ok;
    }

    void start()
    {
        if (state_ == SimulationState::Initialized || state_ == SimulationState::Stopped) {
            state_ = SimulationState::Running;
            time_manager_.resume();
            dispatcher_.dispatch(events::Event::create_system(events::EventType::SimulationStarted,
                                                              time_manager_.get_time()));
        }
    }

    void pause()
    {
        if (state_ == SimulationState::Running) {
            state_ = SimulationState::Paused;
            time_manager_.pause();
            dispatcher_.dispatch(events::Event::create_system(events::EventType::SimulationPaused,
                                                              time_manager_.get_time()));
        }
    }

    void resume()
    {
        if (state_ == SimulationState::Paused) {
            state_ = SimulationState::Running;
            time_manager_.resume();
            dispatcher_.dispatch(events::Event::create_system(events::EventType::SimulationResumed,
                                                              time_manager_.get_time()));
        }
    }

    void stop()
    {
        if (state_ == SimulationState::Running || state_ == SimulationState::Paused) {
            state_ = SimulationState::Stopped;
            time_manager_.pause();
            dispatcher_.dispatch(events::Event::create_system(events::EventType::SimulationStopped,
                                                              time_manager_.get_time()));
        }
    }

    SimulationState get_state() const { return state_; }

    core::TimeManager& time() { return time_manager_; }
    const core::TimeManager& time() const { return time_manager_; }

    // ========================================================================
    // Bodies
    // ========================================================================

    const bodies::BodyCatalog& bodies() const { return catalog_; }

    void set_bodies(bodies::BodyCatalog catalog)
    {
        catalog_ = std::move(catalog);
        soi_candidates_ = catalog_.soi_bodies();
        invalidate_caches();
    }

    void set_soi_candidates(std::vector<BodyId> ids)
    {
        soi_candidates_ = std::move(ids);
        invalidate_caches();
    }

    const std::vector<BodyId>& soi_candidates() const { return soi_candidates_; }

    // ========================================================================
    // Ships
    // ========================================================================

    ShipId add_ship(orbital::ShipState ship)
    {
        if (!ship.frame.is_heliocentric() && !catalog_.find(ship.frame.body)) {
            throw std::invalid_argument("add_ship: frame body " + orbital::to_string(ship.frame) +
                                        " is not in the catalog");
        }
        ShipId id = next_ship_id_++;
        Logger::info("Ship '{}' added as #{} in {}", ship.name, id, orbital::to_string(ship.frame));
        ships_.emplace(id, ShipRecord{std::move(ship)});
        return id;
    }

    ShipId add_ship(const std::string& xml_path)
    {
        try {
            config::ConfigLoader loader;
            config::ShipConfig cfg = loader.load_ship_config(xml_path);
            ShipId id = add_ship(cfg.to_ship(catalog_, time_manager_.get_time()));
            ships_.at(id).command = cfg.command;
            return id;
        } catch (const std::exception& e) {
            Logger::error("Ship definition '{}' rejected: {}", xml_path, e.what());
            return INVALID_SHIP_ID;
        }
    }

    bool remove_ship(ShipId id) { return ships_.erase(id) > 0; }
    bool ship_exists(ShipId id) const { return ships_.count(id) > 0; }

    std::vector<ShipId> ship_ids() const
    {
        std::vector<ShipId> ids;
        ids.reserve(ships_.size());
        for (const auto& [id, record] : ships_) {
            ids.push_back(id);
        }
        return ids;
    }

    struct ShipRecord {
        orbital::ShipState ship;
        orbital::PropulsionCommand command{0.0, 0.0, 0.0};
        orbital::TrajectoryCache trajectory_cache{constants::CACHE_TTL_MS};
        orbital::IntersectionCache intersection_cache{constants::CACHE_TTL_MS};
        std::optional<orbital::StateVector> flyby_entry;
        std::optional<orbital::GravityAssistResult> last_flyby;
    };

    ShipRecord& record(ShipId id)
    {
        auto it = ships_.find(id);
        if (it == ships_.end()) {
            throw std::out_of_range("Unknown ship id " + std::to_string(id));
        }
        return it->second;
    }

    const ShipRecord& record(ShipId id) const
    {
        auto it = ships_.find(id);
        if (it == ships_.end()) {
            throw std::out_of_range("Unknown ship id " + std::to_string(id));
        }
        return it->second;
    }

    orbital::StateVector ship_state(ShipId id) const
    {
        return propagator_.state_at(record(id).ship, time_manager_.get_time()).state;
    }

    orbital::StateVector ship_heliocentric_state(ShipId id) const
    {
        return propagator_.to_heliocentric(ship_state(id), catalog_);
    }

    // ========================================================================
    // Queries
    // ========================================================================

    std::shared_ptr<const orbital::Trajectory> predict(ShipId id, Real duration_days,
                                                       std::optional<Real> start_time)
    {
        ShipRecord& rec = record(id);
        if (!predictor_) {
            throw std::logic_error("predict_trajectory: engine not initialized");
        }
        rec.trajectory_cache.set_ttl_ms(config_.cache_ttl_ms);

        orbital::SimulationContext ctx;
        ctx.time = start_time.value_or(time_manager_.get_time());
        ctx.catalog = &catalog_;
        ctx.soi_candidates = soi_candidates_;

        auto trajectory = predictor_->predict(rec.ship, ctx, rec.command, rec.trajectory_cache,
                                              duration_days);
        if (trajectory->truncated) {
            Logger::debug("Prediction for '{}' truncated: {}", rec.ship.name,
                          orbital::truncation_reason_name(trajectory->reason));
        }
        return trajectory;
    }

    std::shared_ptr<const orbital::IntersectionReport> intersections(ShipId id, Real duration_days,
                                                                     std::optional<Real> start_time)
    {
        auto trajectory = predict(id, duration_days, start_time);
        ShipRecord& rec = record(id);
        rec.intersection_cache.set_ttl_ms(config_.cache_ttl_ms);

        std::vector<BodyId> targets;
        for (const auto& body : catalog_.bodies()) {
            targets.push_back(body.id);
        }
        Real reference = start_time.value_or(time_manager_.get_time());
        return detector_.detect(*trajectory, catalog_, targets, reference, rec.intersection_cache);
    }

    const orbital::GravityAssistAnalyzer& analyzer() const { return analyzer_; }

    void invalidate_caches()
    {
        for (auto& [id, rec] : ships_) {
            rec.trajectory_cache.invalidate();
            rec.intersection_cache.invalidate();
        }
    }

    events::EventDispatcher& dispatcher() { return dispatcher_; }

private:
    struct AdvanceGuard {
        explicit AdvanceGuard(bool& flag) : flag_(flag) { flag_ = true; }
        ~AdvanceGuard() { flag_ = false; }
        bool& flag_;
    };

    void collect_events(ShipId id, ShipRecord& rec, const orbital::StepResult& result,
                        std::vector<events::Event>& pending)
    {
        const std::string& name = rec.ship.name;

        for (const auto& transition : result.transitions) {
            const bodies::Body& body = catalog_.get(transition.body);
            bool entry = transition.kind == orbital::TransitionKind::Entry;

            events::SoiEventData data;
            data.ship_name = name;
            data.body = body.id;
            data.body_name = body.name;
            data.position_before = transition.helio_position_before;
            data.position_after = transition.helio_position_after;
            data.velocity = transition.helio_velocity_after;
            data.eccentricity = transition.eccentricity;
            data.orbit_type = transition.orbit_type;
            data.extreme = transition.extreme;

            pending.push_back(events::Event::create_soi_transition(
                entry ? events::EventType::SoiEntry : events::EventType::SoiExit, id, data,
                transition.time));
            if (entry && transition.extreme) {
                pending.push_back(events::Event::create_soi_transition(
                    events::EventType::ExtremeFlyby, id, data, transition.time));
            }

            track_flyby(rec, transition, body);
        }

        if (result.collision) {
            const bodies::Body& body = catalog_.get(result.ship.frame.body);
            events::CollisionEventData data;
            data.ship_name = name;
            data.body = body.id;
            data.body_name = body.name;
            data.periapsis_before = result.collision->original_periapsis;
            data.safe_radius = result.collision->safe_radius;
            pending.push_back(events::Event::create_collision_avoided(id, data, result.state.time));
        }

        if (result.low_confidence) {
            Logger::debug("Ship '{}' step at JD {:.4f} is low confidence", name, result.state.time);
            pending.push_back(events::Event::create_diagnostic(
                events::EventType::NumericDivergence, id, name, "solver best estimate", 0.0,
                result.state.time));
        }
    }

    void track_flyby(ShipRecord& rec, const orbital::Transition& transition, const bodies::Body& body)
    {
        orbital::StateVector body_state = catalog_.heliocentric_state(body.id, transition.time);
        orbital::StateVector relative;
        relative.frame = orbital::Frame::in_soi(body.id);
        relative.time = transition.time;

        if (transition.kind == orbital::TransitionKind::Entry) {
            relative.position = transition.helio_position_after - body_state.position;
            relative.velocity = transition.helio_velocity_after - body_state.velocity;
            rec.flyby_entry = relative;
            return;
        }

        if (!rec.flyby_entry || rec.flyby_entry->frame != relative.frame) {
            rec.flyby_entry.reset();
            return;
        }
        relative.position = transition.helio_position_before - body_state.position;
        relative.velocity = transition.helio_velocity_before - body_state.velocity;

        orbital::GravityAssistResult flyby = analyzer_.analyze(*rec.flyby_entry, relative, body.mu);
        if (flyby.ok()) {
            Logger::info("Flyby of {}: v_inf {:.6f} AU/day, turn {:.2f} deg, dv {:.6f} AU/day",
                         body.name, flyby.v_infinity, flyby.turning_angle * constants::RAD_TO_DEG,
                         flyby.delta_v);
            rec.last_flyby = flyby;
        }
        rec.flyby_entry.reset();
    }

    config::EngineConfig config_;
    core::TimeManager time_manager_;
    bodies::BodyCatalog catalog_;
    std::vector<BodyId> soi_candidates_;

    orbital::ShipPropagator propagator_;
    std::unique_ptr<orbital::TrajectoryPredictor> predictor_;
    orbital::IntersectionDetector detector_;
    orbital::GravityAssistAnalyzer analyzer_;

    std::map<ShipId, ShipRecord> ships_;
    ShipId next_ship_id_{0};

    events::EventDispatcher dispatcher_;

    SimulationState state_{SimulationState::Uninitialized};
    bool initialized_{false};
    bool advancing_{false};
};

// ============================================================================
// Engine Public Interface
// ============================================================================

Engine::Engine() : impl_(std::make_unique<EngineImpl>()) {}
Engine::~Engine() = default;
Engine::Engine(Engine&&) noexcept = default;
Engine& Engine::operator=(Engine&&) noexcept = default;

bool Engine::initialize(const std::string& config_path) { return impl_->initialize(config_path); }
bool Engine::initialize() { return impl_->initialize_with_config(config::EngineConfig::defaults()); }
bool Engine::initialize(const config::EngineConfig& config) { return impl_->initialize_with_config(config); }
void Engine::shutdown() { impl_->shutdown(); }
bool Engine::is_initialized() const { return impl_->is_initialized(); }
const config::EngineConfig& Engine::get_config() const { return impl_->get_config(); }

AdvanceResult Engine::advance(Real dt) { return impl_->advance(dt); }
void Engine::start() { impl_->start(); }
void Engine::pause() { impl_->pause(); }
void Engine::resume() { impl_->resume(); }
void Engine::stop() { impl_->stop(); }
SimulationState Engine::get_state() const { return impl_->get_state(); }

Real Engine::get_time() const { return impl_->time().get_time(); }
Real Engine::get_time_scale() const { return impl_->time().get_time_scale(); }
void Engine::set_time_scale(Real scale) { impl_->time().set_time_scale(scale); }
void Engine::set_time(Real julian_date) { impl_->time().set_time(julian_date); }

const bodies::BodyCatalog& Engine::get_bodies() const { return impl_->bodies(); }
void Engine::set_bodies(bodies::BodyCatalog catalog) { impl_->set_bodies(std::move(catalog)); }
void Engine::set_soi_candidates(std::vector<BodyId> bodies) { impl_->set_soi_candidates(std::move(bodies)); }
const std::vector<BodyId>& Engine::get_soi_candidates() const { return impl_->soi_candidates(); }

ShipId Engine::add_ship(orbital::ShipState ship) { return impl_->add_ship(std::move(ship)); }
ShipId Engine::add_ship(const std::string& xml_path) { return impl_->add_ship(xml_path); }
bool Engine::remove_ship(ShipId id) { return impl_->remove_ship(id); }
bool Engine::ship_exists(ShipId id) const { return impl_->ship_exists(id); }
std::vector<ShipId> Engine::get_ship_ids() const { return impl_->ship_ids(); }
const orbital::ShipState& Engine::get_ship(ShipId id) const { return impl_->record(id).ship; }
orbital::StateVector Engine::get_ship_state(ShipId id) const { return impl_->ship_state(id); }

orbital::StateVector Engine::get_ship_heliocentric_state(ShipId id) const
{
    return impl_->ship_heliocentric_state(id);
}

void Engine::set_propulsion(ShipId id, const orbital::PropulsionCommand& command)
{
    impl_->record(id).command = command;
}

orbital::PropulsionCommand Engine::get_propulsion(ShipId id) const { return impl_->record(id).command; }

std::optional<orbital::GravityAssistResult> Engine::get_last_flyby(ShipId id) const
{
    return impl_->record(id).last_flyby;
}

std::shared_ptr<const orbital::Trajectory> Engine::predict_trajectory(ShipId id, Real duration_days,
                                                                      std::optional<Real> start_time)
{
    return impl_->predict(id, duration_days, start_time);
}

std::shared_ptr<const orbital::IntersectionReport> Engine::detect_intersections(
    ShipId id, Real duration_days, std::optional<Real> start_time)
{
    return impl_->intersections(id, duration_days, start_time);
}

orbital::GravityAssistResult Engine::analyze_gravity_assist(const orbital::StateVector& entry,
                                                            const orbital::StateVector& exit,
                                                            Real mu) const
{
    return impl_->analyzer().analyze(entry, exit, mu);
}

void Engine::invalidate_caches() { impl_->invalidate_caches(); }

events::EventDispatcher& Engine::get_event_dispatcher() { return impl_->dispatcher(); }

} // namespace conics
