/*
Purpose: End-to-end rollback correctness and determinism through SessionDriver.

What this tests:
- Determinism: two runs fed the same inputs save identical snapshots and checksums.
- Rollback correctness: a run that simulates some frames with mispredicted inputs, then
  loads the last correct frame and resimulates with the real inputs, ends in the same
  state (and checksum) as a run that only ever saw the real inputs. The model spawns and
  despawns tracked entities every few frames so the rollback has to destroy entities
  born during the misprediction and resurrect entities that died during it.
*/

#include "driver.hpp"
#include "input.hpp"

#include <cassert>
#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

namespace
{
    enum : framewarp::ComponentTypeId
    {
        PositionType = 1,
        BulletType = 2,
        PlayerTagType = 3,
    };

    struct Position
    {
        std::int32_t x = 0;
    };

    struct Bullet
    {
        std::int32_t ttl = 0;
        std::int32_t speed = 0;
    };

    struct PlayerTag
    {
        std::uint32_t player = 0;
    };

    class ScriptedSession final : public framewarp::ISession
    {
    public:
        explicit ScriptedSession(std::size_t players) : m_players(players) {}

        framewarp::SessionState state() const override { return framewarp::SessionState::Running; }
        std::size_t num_players() const override { return m_players; }
        std::vector<framewarp::PlayerHandle> local_players() const override { return {}; }
        void add_local_input(framewarp::PlayerHandle, framewarp::ByteBuffer) override {}
        std::size_t max_prediction() const override { return 8; }
        framewarp::Frame confirmed_frame() const override { return framewarp::NullFrame; }

        framewarp::AdvanceResult advance_frame() override
        {
            framewarp::AdvanceResult r;
            if (!script.empty())
            {
                r.requests = std::move(script.front());
                script.pop_front();
            }
            return r;
        }

        void confirm_frame(framewarp::Frame, std::uint64_t) override {}
        std::vector<framewarp::SessionEvent> drain_events() override { return {}; }

        std::deque<std::vector<framewarp::Request>> script;

    private:
        std::size_t m_players = 0;
    };

    // Two players move; a player moving right fires a bullet on even frames. Bullets fly for
    // a few frames and then despawn.
    class ShooterSim final : public framewarp::ISimulation
    {
    public:
        void on_start(framewarp::IFrameContext &ctx) override
        {
            for (std::uint32_t p = 0; p < 2; ++p)
            {
                const auto h = ctx.spawn_rollback();
                ctx.world().insert<Position>(h, PositionType, Position{static_cast<std::int32_t>(p) * 100});
                ctx.world().insert<PlayerTag>(h, PlayerTagType, PlayerTag{p});
            }
        }

        void advance(framewarp::IFrameContext &ctx) override
        {
            auto &world = ctx.world();

            std::vector<framewarp::EntityHandle> expired;
            world.for_each<Bullet>(BulletType, [&](framewarp::EntityHandle h, Bullet &b)
                                   {
                                       world.get_mut<Position>(h, PositionType).x += b.speed;
                                       if (--b.ttl <= 0)
                                       {
                                           expired.push_back(h);
                                       } });
            for (const auto h : expired)
            {
                ctx.despawn(h);
            }

            std::vector<std::pair<framewarp::EntityHandle, std::uint32_t>> players;
            world.for_each<PlayerTag>(PlayerTagType, [&](framewarp::EntityHandle h, PlayerTag &t)
                                      { players.emplace_back(h, t.player); });

            for (const auto &[h, player] : players)
            {
                const auto dx = framewarp::input::unpack_or<std::int32_t>(ctx.inputs().at(player), 0);
                auto &pos = world.get_mut<Position>(h, PositionType);
                pos.x += dx;
                if (dx > 0 && ctx.frame() % 2 == 0)
                {
                    const auto b = ctx.spawn_rollback();
                    world.insert<Position>(b, PositionType, Position{pos.x});
                    world.insert<Bullet>(b, BulletType, Bullet{3, dx * 2});
                }
            }
        }
    };

    std::vector<framewarp::PlayerInput> inputs_for(std::int32_t a, std::int32_t b)
    {
        return {
            framewarp::PlayerInput{framewarp::input::pack(a), framewarp::InputStatus::Confirmed},
            framewarp::PlayerInput{framewarp::input::pack(b), framewarp::InputStatus::Confirmed},
        };
    }

    // Real inputs.
    std::vector<framewarp::PlayerInput> real_inputs(framewarp::Frame f)
    {
        return inputs_for((f % 3 == 0) ? 2 : 1, (f % 4 == 1) ? 3 : -1);
    }

    // Prediction for player 1 (repeat the last confirmed input), wrong from frame 5 on.
    std::vector<framewarp::PlayerInput> predicted_inputs(framewarp::Frame f)
    {
        auto in = real_inputs(f);
        in[1] = framewarp::PlayerInput{framewarp::input::pack<std::int32_t>(5), framewarp::InputStatus::Predicted};
        return in;
    }

    std::unique_ptr<framewarp::SessionDriver> make_driver(std::shared_ptr<ScriptedSession> session)
    {
        framewarp::DriverConfig cfg;
        cfg.maxPredictionFrames = 8;
        cfg.enableInvariantChecks = true;
        auto driver = std::make_unique<framewarp::SessionDriver>(cfg, std::move(session), std::make_unique<ShooterSim>());
        driver->register_copy<Position>(PositionType, "Position");
        driver->register_copy<Bullet>(BulletType, "Bullet");
        driver->register_copy<PlayerTag>(PlayerTagType, "PlayerTag");
        driver->start();
        return driver;
    }

    constexpr framewarp::Frame EndFrame = 16;

    // Saves and advances frames [0, EndFrame) with the real inputs, then saves EndFrame.
    std::unique_ptr<framewarp::SessionDriver> run_straight()
    {
        auto session = std::make_shared<ScriptedSession>(2);
        for (framewarp::Frame f = 0; f < EndFrame; ++f)
        {
            session->script.push_back({framewarp::Request::save(f), framewarp::Request::advance(f, real_inputs(f))});
        }
        session->script.push_back({framewarp::Request::save(EndFrame)});

        auto driver = make_driver(session);
        for (framewarp::Frame f = 0; f <= EndFrame; ++f)
        {
            const auto r = driver->tick();
            assert(!r.terminal());
        }
        return driver;
    }
}

int main()
{
    using namespace framewarp;

    // Determinism across runs.
    {
        auto a = run_straight();
        auto b = run_straight();
        const WorldSnapshot &sa = a->store().load(EndFrame);
        const WorldSnapshot &sb = b->store().load(EndFrame);
        assert(sa.same_state(sb, a->registry()));
        assert(sa.checksum == sb.checksum);
        assert(a->current_frame() == EndFrame);
        assert(sa.entities.size() > 2);
    }

    // Rollback: mispredict frames [5, 11), then go back to 5 and resimulate.
    {
        auto reference = run_straight();
        const WorldSnapshot &s1 = reference->store().load(EndFrame);

        constexpr Frame Confirmed = 5;
        constexpr Frame Predicted = 11;

        auto session = std::make_shared<ScriptedSession>(2);
        for (Frame f = 0; f < Predicted; ++f)
        {
            const auto in = (f < Confirmed) ? real_inputs(f) : predicted_inputs(f);
            session->script.push_back({Request::save(f), Request::advance(f, in)});
        }

        std::vector<Request> correction{Request::load(Confirmed)};
        for (Frame f = Confirmed; f < Predicted; ++f)
        {
            correction.push_back(Request::advance(f, real_inputs(f)));
            correction.push_back(Request::save(f + 1));
        }
        correction.push_back(Request::advance(Predicted, real_inputs(Predicted)));
        session->script.push_back(std::move(correction));

        for (Frame f = Predicted + 1; f < EndFrame; ++f)
        {
            session->script.push_back({Request::save(f), Request::advance(f, real_inputs(f))});
        }
        session->script.push_back({Request::save(EndFrame)});

        auto driver = make_driver(session);
        while (!session->script.empty())
        {
            const auto r = driver->tick();
            assert(!r.terminal());
            assert(r.objectErrors == 0);
        }
        assert(driver->current_frame() == EndFrame);
        assert(driver->stats().rolledBackFrames == static_cast<std::uint64_t>(Predicted - Confirmed));

        const WorldSnapshot &s2 = driver->store().load(EndFrame);

        // Entities spawned during resimulation got fresh ids, so compare by position.
        assert(s1.same_state(s2, reference->registry(), false));
        assert(s1.checksum == s2.checksum);
        assert(driver->world().entity_count() == reference->world().entity_count());
        assert(driver->diagnostics().objectErrors == 0);
    }

    return 0;
}
