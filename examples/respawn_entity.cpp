#include "driver.hpp"
#include "input.hpp"

#include <iostream>

namespace
{
    enum : framewarp::ComponentTypeId
    {
        HealthType = 1,
    };

    struct Health
    {
        std::int32_t hp = 0;
    };

    // Lock-step session that, once, pretends the remote input for an old frame arrived late
    // and asks for a rollback to it.
    class LateInputSession final : public framewarp::ISession
    {
    public:
        LateInputSession(framewarp::Frame rollbackAt, framewarp::Frame rollbackTo) : m_rollbackAt(rollbackAt), m_rollbackTo(rollbackTo) {}

        framewarp::SessionState state() const override { return framewarp::SessionState::Running; }
        std::size_t num_players() const override { return 1; }
        std::vector<framewarp::PlayerHandle> local_players() const override { return {0}; }
        void add_local_input(framewarp::PlayerHandle, framewarp::ByteBuffer) override {}

        std::size_t max_prediction() const override { return static_cast<std::size_t>(m_rollbackAt - m_rollbackTo); }

        // Frames before the late input are final; after the rollback everything is.
        framewarp::Frame confirmed_frame() const override
        {
            return m_frame > m_rollbackAt ? m_frame - 1 : m_rollbackTo - 1;
        }

        framewarp::AdvanceResult advance_frame() override
        {
            framewarp::AdvanceResult r;
            if (m_frame == m_rollbackAt)
            {
                // The late input says: no damage on the frames we already simulated.
                r.requests.push_back(framewarp::Request::load(m_rollbackTo));
                for (framewarp::Frame f = m_rollbackTo; f < m_frame; ++f)
                {
                    r.requests.push_back(framewarp::Request::advance(f, damage_(0)));
                    r.requests.push_back(framewarp::Request::save(f + 1));
                }
            }
            else
            {
                r.requests.push_back(framewarp::Request::save(m_frame));
            }
            r.requests.push_back(framewarp::Request::advance(m_frame, damage_(m_frame < m_rollbackAt ? 1 : 0)));
            ++m_frame;
            return r;
        }

        void confirm_frame(framewarp::Frame, std::uint64_t) override {}
        std::vector<framewarp::SessionEvent> drain_events() override { return {}; }

    private:
        static std::vector<framewarp::PlayerInput> damage_(std::int32_t amount)
        {
            return {framewarp::PlayerInput{framewarp::input::pack(amount), framewarp::InputStatus::Confirmed}};
        }

        framewarp::Frame m_frame = 0;
        framewarp::Frame m_rollbackAt = 0;
        framewarp::Frame m_rollbackTo = 0;
    };

    // Input is damage applied to every entity; an entity at 0 hp is despawned.
    class DamageSim final : public framewarp::ISimulation
    {
    public:
        void on_start(framewarp::IFrameContext &ctx) override
        {
            const auto h = ctx.spawn_rollback();
            ctx.world().insert<Health>(h, HealthType, Health{3});
            std::cout << "spawned id=" << *ctx.rollback_id(h) << " handle=" << framewarp::to_string(h) << "\n";
        }

        void advance(framewarp::IFrameContext &ctx) override
        {
            const auto damage = framewarp::input::unpack<std::int32_t>(ctx.inputs().at(0));
            std::vector<framewarp::EntityHandle> dead;
            ctx.world().for_each<Health>(HealthType, [&](framewarp::EntityHandle h, Health &health)
                                         {
                                             health.hp -= damage;
                                             if (health.hp <= 0)
                                             {
                                                 dead.push_back(h);
                                             } });
            for (const auto h : dead)
            {
                std::cout << "frame " << ctx.frame() << ": id=" << *ctx.rollback_id(h) << " died\n";
                ctx.despawn(h);
            }
        }
    };

    void print_world(framewarp::SessionDriver &driver)
    {
        std::cout << "frame " << driver.current_frame() << ": " << driver.world().entity_count() << " entities";
        driver.world().for_each<Health>(HealthType, [&](framewarp::EntityHandle h, Health &health)
                                        { std::cout << " [id=" << *driver.rollback_id(h) << " handle=" << framewarp::to_string(h)
                                                    << " hp=" << health.hp << "]"; });
        std::cout << "\n";
    }
}

int main()
{
    framewarp::DriverConfig cfg;
    cfg.maxPredictionFrames = 8;
    cfg.logLevel = framewarp::LogLevel::Info;
    cfg.enableInvariantChecks = true;

    framewarp::SessionDriver driver(cfg, std::make_shared<LateInputSession>(5, 1), std::make_unique<DamageSim>());
    driver.register_copy<Health>(HealthType, "Health");
    driver.start();

    for (int i = 0; i < 7; ++i)
    {
        const auto report = driver.tick();
        if (report.terminal())
        {
            std::cerr << "aborted: " << report.fatalMessage << "\n";
            return 1;
        }
        if (report.loads > 0)
        {
            std::cout << "rolled back and resimulated " << (report.advances - 1) << " frames\n";
        }
        print_world(driver);
    }

    return driver.world().entity_count() == 1 ? 0 : 1;
}
