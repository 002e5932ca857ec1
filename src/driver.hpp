#pragma once

#include "identity_map.hpp"
#include "log.hpp"
#include "reconcile.hpp"
#include "session.hpp"
#include "simulation.hpp"
#include "snapshot_store.hpp"
#include "world.hpp"

#include <memory>
#include <string>
#include <vector>

namespace framewarp
{
    enum class DriverState : std::uint8_t
    {
        Idle = 0,
        Synchronizing = 1,
        Running = 2,
        Advancing = 3,
        RollingBack = 4,
        Aborted = 5,
    };

    inline const char *driver_state_name(DriverState s) noexcept
    {
        switch (s)
        {
        case DriverState::Idle:
            return "Idle";
        case DriverState::Synchronizing:
            return "Synchronizing";
        case DriverState::Running:
            return "Running";
        case DriverState::Advancing:
            return "Advancing";
        case DriverState::RollingBack:
            return "RollingBack";
        case DriverState::Aborted:
            return "Aborted";
        }
        return "Unknown";
    }

    enum class DriverEventKind : std::uint8_t
    {
        Synchronized = 1,
        AdvanceCompleted = 2,
        PlayerDisconnected = 3,
        DesyncDetected = 4,
        Aborted = 5,
    };

    struct DriverEvent
    {
        DriverEventKind kind = DriverEventKind::AdvanceCompleted;
        Frame frame = NullFrame;
        PlayerHandle player = 0;
        std::uint64_t localChecksum = 0;
        std::uint64_t remoteChecksum = 0;
        std::string message;
    };

    struct DriverConfig
    {
        // Frames the session may run ahead of confirmed input. The snapshot store keeps one
        // more slot than this so the oldest frame a Load can name is still held.
        std::size_t maxPredictionFrames = 8;

        // Fixed simulation rate used by update().
        double fps = 60.0;

        // update() stretches its step by this factor while the session reports we are ahead.
        double runSlowFactor = 1.1;

        // Logging (disabled by default).
        LogLevel logLevel = LogLevel::Off;

        // Compute a checksum on every Save and report it with confirm_frame.
        bool enableChecksums = true;

        // Enable extra runtime invariant checks (raises ProtocolFatal on violation).
#if defined(FRAMEWARP_ENABLE_INVARIANT_CHECKS_DEFAULT)
        bool enableInvariantChecks = (FRAMEWARP_ENABLE_INVARIANT_CHECKS_DEFAULT != 0);
#else
        bool enableInvariantChecks = false;
#endif

        // Optional: reads this tick's input for a local player. Called once per local player
        // right before advance_frame. If unset, the game feeds add_local_input itself.
        std::function<ByteBuffer(PlayerHandle)> inputSampler;

        // Optional: game-layer notifications (advance completed, desync, disconnect, abort).
        std::function<void(const DriverEvent &)> eventSink;
    };

    // Outcome of one outer tick.
    struct TickReport
    {
        // Current frame after the tick.
        Frame frame = 0;
        DriverState state = DriverState::Idle;

        // Newest frame the session reports as final (never resimulated), or NullFrame.
        Frame confirmedFrame = NullFrame;

        std::size_t saves = 0;
        std::size_t loads = 0;
        std::size_t advances = 0;

        // Entities skipped by reconciliation during this tick.
        std::uint64_t objectErrors = 0;

        // Rollback-despawned entities destroyed because their frame became confirmed.
        std::size_t despawnsConfirmed = 0;

        // Tick consumed by a WaitRecommendation.
        bool skipped = false;

        // Session refused to advance (prediction threshold reached).
        bool stalled = false;

        std::vector<DriverEvent> events;

        // Set when the session aborted (this tick or earlier).
        std::string fatalMessage;

        bool terminal() const noexcept { return state == DriverState::Aborted; }
    };

    // Binds a rollback session to a live world: executes the session's Save/Load/Advance
    // requests in order against the world, the identity map and the snapshot store.
    //
    // Single-threaded; every call must come from the thread that owns the world.
    class SessionDriver
    {
    public:
        struct Stats
        {
            std::uint64_t ticks = 0;
            std::uint64_t saves = 0;
            std::uint64_t loads = 0;
            std::uint64_t advances = 0;
            std::uint64_t skippedTicks = 0;
            std::uint64_t stalledTicks = 0;
            std::uint64_t rolledBackFrames = 0;
            std::uint64_t objectErrors = 0;
            std::uint64_t staleBindings = 0;
            std::uint64_t desyncs = 0;
            std::uint64_t deferredDespawns = 0;
            std::uint64_t confirmedDespawns = 0;
            std::uint64_t retiredIds = 0;
        };

        SessionDriver(DriverConfig cfg, std::shared_ptr<ISession> session, std::unique_ptr<ISimulation> sim)
            : m_cfg(std::move(cfg)),
              m_session(std::move(session)),
              m_sim(std::move(sim)),
              m_world(m_registry),
              m_store(capacity_or_throw_(m_cfg.maxPredictionFrames))
        {
            if (!m_session)
            {
                throw ConfigurationError("SessionDriver requires a session");
            }
            if (!m_sim)
            {
                throw ConfigurationError("SessionDriver requires a simulation");
            }
            if (!(m_cfg.fps > 0.0))
            {
                throw ConfigurationError("SessionDriver: fps must be positive");
            }
            if (!(m_cfg.runSlowFactor >= 1.0))
            {
                throw ConfigurationError("SessionDriver: runSlowFactor must be >= 1");
            }

            Logger::instance().set_level(m_cfg.logLevel);

            // Entities destroyed directly by game code must lose their RollbackId binding.
            m_world.set_despawn_hook([this](EntityHandle h)
                                     {
                                         m_ids.on_despawn(h);
                                         m_pendingDespawn.erase(h); });
        }

        SessionDriver(const SessionDriver &) = delete;
        SessionDriver &operator=(const SessionDriver &) = delete;

        // Registration is only allowed before start().
        void register_type(ComponentTypeOps ops)
        {
            require_idle_("register_type");
            m_registry.register_type(std::move(ops));
        }

        template <class T>
        void register_copy(ComponentTypeId type, std::string name)
        {
            require_idle_("register_copy");
            m_registry.register_copy<T>(type, std::move(name));
        }

        template <class T>
        void register_clone(ComponentTypeId type, std::string name, std::function<std::uint64_t(const T &)> hasher = {})
        {
            require_idle_("register_clone");
            m_registry.register_clone<T>(type, std::move(name), std::move(hasher));
        }

        template <class T>
        void register_entity_refs(ComponentTypeId type, std::function<void(T &, const EntityMapper &)> fn)
        {
            require_idle_("register_entity_refs");
            m_registry.register_entity_refs<T>(type, std::move(fn));
        }

        const ComponentRegistry &registry() const noexcept { return m_registry; }
        World &world() noexcept { return m_world; }
        const World &world() const noexcept { return m_world; }
        const IdentityMap &identity_map() const noexcept { return m_ids; }
        const SnapshotStore &store() const noexcept { return m_store; }
        ISession &session() noexcept { return *m_session; }
        const DriverConfig &config() const noexcept { return m_cfg; }
        const Stats &stats() const noexcept { return m_stats; }
        const Diagnostics &diagnostics() const noexcept { return m_diag; }

        DriverState state() const noexcept { return m_state; }
        Frame current_frame() const noexcept { return m_frame; }

        // Spawns a new entity carrying the rollback marker.
        EntityHandle spawn_rollback()
        {
            const EntityHandle h = m_world.spawn();
            mark_rollback(h);
            return h;
        }

        // Attaches the rollback marker to an existing entity. Returns the entity's RollbackId
        // (the existing one if it is already tracked).
        RollbackId mark_rollback(EntityHandle h)
        {
            if (!m_world.alive(h))
            {
                throw ObjectLevelError("mark_rollback: entity " + to_string(h) + " is not alive");
            }
            if (auto existing = m_ids.id_of(h))
            {
                return *existing;
            }
            const RollbackId id = m_ids.allocate();
            m_ids.bind(id, h);
            return id;
        }

        std::optional<RollbackId> rollback_id(EntityHandle h) const { return m_ids.id_of(h); }

        // Despawn that a rollback can undo. A tracked entity is hidden (World::set_enabled)
        // and keeps its handle and components until the frame it was despawned on is
        // confirmed; a Load of an earlier frame brings it back on the same handle. Untracked
        // entities, and entities despawned on an already confirmed frame, go immediately.
        void despawn_rollback(EntityHandle h)
        {
            if (!m_world.alive(h))
            {
                throw ObjectLevelError("despawn_rollback: entity " + to_string(h) + " is not alive");
            }
            if (!m_world.enabled(h))
            {
                return;
            }
            if (!m_ids.id_of(h) || m_session->confirmed_frame() >= m_frame)
            {
                m_world.despawn(h);
                return;
            }
            m_world.set_enabled(h, false);
            m_pendingDespawn.emplace(h, m_frame);
            ++m_stats.deferredDespawns;
            Logger::instance().logf(LogLevel::Trace, m_frame, "driver", "despawn deferred: handle=%s", to_string(h).c_str());
        }

        // Hidden entities waiting for their despawn frame to be confirmed.
        std::size_t pending_despawns() const noexcept { return m_pendingDespawn.size(); }
        Frame confirmed_frame() const noexcept { return m_confirmed; }

        void add_local_input(PlayerHandle player, ByteBuffer input)
        {
            m_session->add_local_input(player, std::move(input));
        }

        void start()
        {
            if (m_state != DriverState::Idle)
            {
                throw ConfigurationError("SessionDriver::start: already started");
            }
            if (m_session->max_prediction() > m_cfg.maxPredictionFrames)
            {
                throw ConfigurationError("SessionDriver::start: session may roll back " + std::to_string(m_session->max_prediction()) +
                                         " frames but maxPredictionFrames=" + std::to_string(m_cfg.maxPredictionFrames));
            }
            m_registry.freeze();
            m_store.reset();
            m_frame = 0;
            m_accumulator = 0.0;
            m_framesToSkip = 0;
            m_confirmed = NullFrame;

            const std::vector<PlayerInput> noInputs;
            FrameContextImpl ctx(*this, m_frame, noInputs);
            m_sim->on_start(ctx);

            m_state = (m_session->state() == SessionState::Running) ? DriverState::Running : DriverState::Synchronizing;
            Logger::instance().logf(LogLevel::Info, m_frame, "driver", "started: players=%zu capacity=%zu state=%s",
                                    m_session->num_players(), m_store.capacity(), driver_state_name(m_state));
        }

        // One outer tick: pump the session, then execute whatever it asks for.
        TickReport tick()
        {
            if (m_state == DriverState::Idle)
            {
                throw ConfigurationError("SessionDriver::tick: start() has not been called");
            }
            if (m_state == DriverState::Aborted)
            {
                return terminal_report_();
            }

            ++m_stats.ticks;
            TickReport report;
            const std::uint64_t objectErrorsBefore = m_diag.objectErrors;

            try
            {
                run_tick_(report);
            }
            catch (const ProtocolFatal &e)
            {
                abort_(e.what(), report);
            }

            report.objectErrors = m_diag.objectErrors - objectErrorsBefore;
            m_stats.objectErrors = m_diag.objectErrors;
            m_stats.staleBindings = m_diag.staleBindings;
            report.frame = m_frame;
            report.confirmedFrame = m_confirmed;
            report.state = m_state;
            report.fatalMessage = m_fatalMessage;
            return report;
        }

        // Fixed-timestep pacing. Runs as many ticks as `dtSeconds` (plus any remainder from
        // earlier calls) pays for, stopping early if the session aborts.
        std::vector<TickReport> update(double dtSeconds)
        {
            std::vector<TickReport> out;
            if (m_state == DriverState::Aborted)
            {
                out.push_back(terminal_report_());
                return out;
            }
            if (dtSeconds > 0.0)
            {
                m_accumulator += dtSeconds;
            }

            while (true)
            {
                double step = 1.0 / m_cfg.fps;
                if (m_state != DriverState::Idle && m_session->frames_ahead() > 0)
                {
                    step *= m_cfg.runSlowFactor;
                }
                if (m_accumulator < step)
                {
                    break;
                }
                m_accumulator -= step;
                out.push_back(tick());
                if (out.back().terminal())
                {
                    break;
                }
            }
            return out;
        }

    private:
        class FrameContextImpl final : public IFrameContext
        {
        public:
            FrameContextImpl(SessionDriver &driver, Frame frame, const std::vector<PlayerInput> &inputs)
                : m_driver(driver), m_frame(frame), m_inputs(inputs)
            {
            }

            Frame frame() const noexcept override { return m_frame; }
            const std::vector<PlayerInput> &inputs() const noexcept override { return m_inputs; }
            World &world() override { return m_driver.m_world; }
            EntityHandle spawn_rollback() override { return m_driver.spawn_rollback(); }
            void despawn(EntityHandle h) override { m_driver.m_world.despawn(h); }
            void despawn_rollback(EntityHandle h) override { m_driver.despawn_rollback(h); }
            std::optional<RollbackId> rollback_id(EntityHandle h) const override { return m_driver.m_ids.id_of(h); }

        private:
            SessionDriver &m_driver;
            Frame m_frame = 0;
            const std::vector<PlayerInput> &m_inputs;
        };

        static std::size_t capacity_or_throw_(std::size_t maxPredictionFrames)
        {
            if (maxPredictionFrames >= static_cast<std::size_t>(std::numeric_limits<Frame>::max()))
            {
                throw ConfigurationError("SessionDriver: maxPredictionFrames too large");
            }
            return maxPredictionFrames + 1;
        }

        void require_idle_(const char *what) const
        {
            if (m_state != DriverState::Idle)
            {
                throw ConfigurationError(std::string(what) + ": registration after the session started");
            }
        }

        void emit_(DriverEvent ev, TickReport &report)
        {
            if (m_cfg.eventSink)
            {
                m_cfg.eventSink(ev);
            }
            report.events.push_back(std::move(ev));
        }

        void run_tick_(TickReport &report)
        {
            if (m_framesToSkip > 0)
            {
                --m_framesToSkip;
                ++m_stats.skippedTicks;
                report.skipped = true;
                Logger::instance().logf(LogLevel::Info, m_frame, "driver", "tick skipped (wait recommendation), remaining=%u", m_framesToSkip);
                return;
            }

            m_session->poll_remote();
            drain_session_events_(report);

            if (m_session->state() != SessionState::Running)
            {
                return;
            }
            if (m_state == DriverState::Synchronizing)
            {
                m_state = DriverState::Running;
            }

            if (m_cfg.inputSampler)
            {
                for (const PlayerHandle p : m_session->local_players())
                {
                    m_session->add_local_input(p, m_cfg.inputSampler(p));
                }
            }

            AdvanceResult result = m_session->advance_frame();
            if (result.status == AdvanceStatus::PredictionThreshold)
            {
                ++m_stats.stalledTicks;
                report.stalled = true;
                Logger::instance().logf(LogLevel::Info, m_frame, "driver", "prediction threshold reached, holding frame");
            }

            for (const auto &req : result.requests)
            {
                execute_(req, report);
            }
            m_state = DriverState::Running;

            sweep_confirmed_(report);
            drain_session_events_(report);
        }

        // Destroys hidden entities whose despawn frame is now confirmed, in handle order.
        void sweep_confirmed_(TickReport &report)
        {
            const Frame confirmed = m_session->confirmed_frame();
            if (confirmed == m_confirmed)
            {
                return;
            }
            m_confirmed = confirmed;

            std::vector<EntityHandle> due;
            for (const auto &[h, frame] : m_pendingDespawn)
            {
                if (frame <= confirmed)
                {
                    due.push_back(h);
                }
            }
            for (const EntityHandle h : due)
            {
                // The despawn hook drops the pending entry and the binding.
                m_world.despawn(h);
                ++report.despawnsConfirmed;
                ++m_stats.confirmedDespawns;
            }
            if (!due.empty())
            {
                Logger::instance().logf(LogLevel::Debug, m_frame, "driver", "confirmed frame=%d, destroyed %zu despawned entities",
                                        static_cast<int>(confirmed), due.size());
            }
        }

        void execute_(const Request &req, TickReport &report)
        {
            Logger::instance().logf(LogLevel::Trace, m_frame, "driver", "request %s frame=%d", request_kind_name(req.kind), static_cast<int>(req.frame));

            switch (req.kind)
            {
            case RequestKind::Save:
                handle_save_(req.frame);
                ++report.saves;
                ++m_stats.saves;
                break;
            case RequestKind::Load:
                handle_load_(req.frame);
                ++report.loads;
                ++m_stats.loads;
                break;
            case RequestKind::Advance:
                handle_advance_(req, report);
                ++report.advances;
                ++m_stats.advances;
                break;
            default:
                throw ProtocolFatal("unknown request kind=" + std::to_string(static_cast<int>(req.kind)));
            }

            validate_invariants_(request_kind_name(req.kind));
        }

        void handle_save_(Frame frame)
        {
            if (frame != m_frame)
            {
                throw ProtocolFatal("Save: frame=" + std::to_string(frame) + " does not match current frame=" + std::to_string(m_frame));
            }
            WorldSnapshot snap = capture(frame, m_world, m_registry, m_ids, m_diag, m_cfg.enableChecksums);
            const std::uint64_t checksum = snap.checksum;
            m_store.save(std::move(snap));
            m_stats.retiredIds += m_ids.retire_unbound([this](RollbackId id)
                                                       { return m_store.references(id); });
            m_session->confirm_frame(frame, checksum);
        }

        void handle_load_(Frame frame)
        {
            m_state = DriverState::RollingBack;
            const WorldSnapshot &snap = m_store.load(frame);
            const RestoreReport restored = restore(snap, m_world, m_registry, m_ids, m_diag);
            for (auto it = m_pendingDespawn.begin(); it != m_pendingDespawn.end();)
            {
                if (m_world.enabled(it->first))
                {
                    it = m_pendingDespawn.erase(it);
                }
                else
                {
                    ++it;
                }
            }
            if (m_frame > frame)
            {
                m_stats.rolledBackFrames += static_cast<std::uint64_t>(m_frame - frame);
            }
            Logger::instance().logf(LogLevel::Debug, frame, "driver", "rolled back from frame=%d (skipped=%zu)", static_cast<int>(m_frame), restored.skipped);
            m_frame = frame;
        }

        void handle_advance_(const Request &req, TickReport &report)
        {
            if (req.frame != m_frame)
            {
                throw ProtocolFatal("Advance: frame=" + std::to_string(req.frame) + " does not match current frame=" + std::to_string(m_frame));
            }
            if (req.inputs.size() != m_session->num_players())
            {
                throw ProtocolFatal("Advance: got " + std::to_string(req.inputs.size()) + " inputs for " +
                                    std::to_string(m_session->num_players()) + " players");
            }
            if (m_state != DriverState::RollingBack)
            {
                m_state = DriverState::Advancing;
            }

            FrameContextImpl ctx(*this, m_frame, req.inputs);
            m_sim->advance(ctx);
            ++m_frame;

            DriverEvent ev;
            ev.kind = DriverEventKind::AdvanceCompleted;
            ev.frame = req.frame;
            emit_(std::move(ev), report);
        }

        void drain_session_events_(TickReport &report)
        {
            for (const auto &sev : m_session->drain_events())
            {
                switch (sev.kind)
                {
                case SessionEventKind::Synchronized:
                {
                    if (m_state == DriverState::Synchronizing)
                    {
                        m_state = DriverState::Running;
                    }
                    Logger::instance().logf(LogLevel::Info, m_frame, "driver", "session synchronized");
                    DriverEvent ev;
                    ev.kind = DriverEventKind::Synchronized;
                    ev.frame = m_frame;
                    emit_(std::move(ev), report);
                    break;
                }
                case SessionEventKind::PlayerDisconnected:
                {
                    Logger::instance().logf(LogLevel::Warn, m_frame, "driver", "player %u disconnected", sev.player);
                    DriverEvent ev;
                    ev.kind = DriverEventKind::PlayerDisconnected;
                    ev.frame = sev.frame;
                    ev.player = sev.player;
                    emit_(std::move(ev), report);
                    break;
                }
                case SessionEventKind::DesyncDetected:
                {
                    ++m_stats.desyncs;
                    Logger::instance().logf(LogLevel::Error, sev.frame, "driver", "desync detected: local=%016llx remote=%016llx",
                                            static_cast<unsigned long long>(sev.localChecksum),
                                            static_cast<unsigned long long>(sev.remoteChecksum));
                    DriverEvent ev;
                    ev.kind = DriverEventKind::DesyncDetected;
                    ev.frame = sev.frame;
                    ev.player = sev.player;
                    ev.localChecksum = sev.localChecksum;
                    ev.remoteChecksum = sev.remoteChecksum;
                    emit_(std::move(ev), report);
                    break;
                }
                case SessionEventKind::WaitRecommendation:
                    m_framesToSkip += sev.skipFrames;
                    Logger::instance().logf(LogLevel::Info, m_frame, "driver", "wait recommendation: skip %u frames", sev.skipFrames);
                    break;
                }
            }
        }

        void abort_(const char *what, TickReport &report)
        {
            m_state = DriverState::Aborted;
            m_fatalMessage = what;
            Logger::instance().logf(LogLevel::Error, m_frame, "driver", "session aborted: %s", what);

            DriverEvent ev;
            ev.kind = DriverEventKind::Aborted;
            ev.frame = m_frame;
            ev.message = m_fatalMessage;
            emit_(std::move(ev), report);
        }

        TickReport terminal_report_() const
        {
            TickReport report;
            report.frame = m_frame;
            report.confirmedFrame = m_confirmed;
            report.state = DriverState::Aborted;
            report.fatalMessage = m_fatalMessage;
            return report;
        }

        void invariant_or_throw_(bool ok, const std::string &msg) const
        {
            if (!m_cfg.enableInvariantChecks)
            {
                return;
            }
            if (!ok)
            {
                throw ProtocolFatal(msg);
            }
        }

        void validate_invariants_(const char *where) const
        {
            if (!m_cfg.enableInvariantChecks)
            {
                return;
            }

            invariant_or_throw_(m_frame >= 0, std::string("invariant: negative current frame after ") + where);

            // Every bound RollbackId resolves to a live entity that maps back to it.
            for (const RollbackId id : m_ids.live_ids())
            {
                const auto h = m_ids.resolve(id);
                invariant_or_throw_(h.has_value() && m_world.alive(*h),
                                    std::string("invariant: RollbackId=") + std::to_string(id) + " bound to a dead handle after " + where);
                const auto back = m_ids.id_of(*h);
                invariant_or_throw_(back.has_value() && *back == id,
                                    std::string("invariant: reverse lookup mismatch for RollbackId=") + std::to_string(id) + " after " + where);
            }
        }

        DriverConfig m_cfg;
        std::shared_ptr<ISession> m_session;
        std::unique_ptr<ISimulation> m_sim;

        ComponentRegistry m_registry;
        World m_world;
        IdentityMap m_ids;
        SnapshotStore m_store;
        Diagnostics m_diag;
        Stats m_stats;

        DriverState m_state = DriverState::Idle;
        Frame m_frame = 0;
        double m_accumulator = 0.0;
        std::uint32_t m_framesToSkip = 0;
        Frame m_confirmed = NullFrame;
        std::map<EntityHandle, Frame> m_pendingDespawn;
        std::string m_fatalMessage;
    };
}
