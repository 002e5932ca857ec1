#include "driver.hpp"
#include "input.hpp"
#include "random.hpp"
#include "synctest_session.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string_view>

namespace
{
    enum : framewarp::ComponentTypeId
    {
        BoxType = 1,
        OwnerType = 2,
    };

    // Fixed point, 1/256 units.
    struct Box
    {
        std::int32_t x = 0;
        std::int32_t y = 0;
        std::int32_t vx = 0;
        std::int32_t vy = 0;
    };

    struct Owner
    {
        framewarp::PlayerHandle player = 0;
    };

    enum : std::uint8_t
    {
        InputUp = 1u << 0,
        InputDown = 1u << 1,
        InputLeft = 1u << 2,
        InputRight = 1u << 3,
    };

    struct BoxInput
    {
        std::uint8_t buttons = 0;
    };

    constexpr std::int32_t ArenaSize = 256 * 400;
    constexpr std::int32_t Accel = 64;
    constexpr std::int32_t MaxSpeed = 256 * 6;

    constexpr std::uint32_t InputStream = 0;
    constexpr std::uint32_t WindStream = 1;

    class BoxGame final : public framewarp::ISimulation
    {
    public:
        BoxGame(std::uint32_t players, std::uint64_t seed) : m_players(players), m_seed(seed) {}

        void on_start(framewarp::IFrameContext &ctx) override
        {
            for (std::uint32_t p = 0; p < m_players; ++p)
            {
                const auto h = ctx.spawn_rollback();
                const std::int32_t offset = static_cast<std::int32_t>(p + 1) * ArenaSize / static_cast<std::int32_t>(m_players + 1);
                ctx.world().insert<Box>(h, BoxType, Box{offset, ArenaSize / 2, 0, 0});
                ctx.world().insert<Owner>(h, OwnerType, Owner{p});
            }
        }

        void advance(framewarp::IFrameContext &ctx) override
        {
            auto &world = ctx.world();
            world.for_each<Owner>(OwnerType, [&](framewarp::EntityHandle h, Owner &owner)
                                  {
                                      const auto in = framewarp::input::unpack_or<BoxInput>(ctx.inputs().at(owner.player), BoxInput{});
                                      auto &box = world.get_mut<Box>(h, BoxType);
                                      // Occasional gust of wind.
                                      framewarp::FrameRng rng(m_seed, ctx.frame(), WindStream, owner.player);
                                      if (rng.next_chance(0.05))
                                      {
                                          box.vx += static_cast<std::int32_t>(rng.next_range(-Accel, Accel));
                                      }
                                      step_(box, in.buttons); });
        }

    private:
        static std::int32_t clamp_(std::int32_t v, std::int32_t lo, std::int32_t hi)
        {
            return v < lo ? lo : (v > hi ? hi : v);
        }

        static void step_(Box &box, std::uint8_t buttons)
        {
            if (buttons & InputUp)
                box.vy -= Accel;
            if (buttons & InputDown)
                box.vy += Accel;
            if (buttons & InputLeft)
                box.vx -= Accel;
            if (buttons & InputRight)
                box.vx += Accel;

            // Friction: lose 1/16 of the speed per frame.
            box.vx -= box.vx / 16;
            box.vy -= box.vy / 16;
            box.vx = clamp_(box.vx, -MaxSpeed, MaxSpeed);
            box.vy = clamp_(box.vy, -MaxSpeed, MaxSpeed);

            box.x += box.vx;
            box.y += box.vy;

            // Bounce off the walls.
            if (box.x < 0 || box.x > ArenaSize)
            {
                box.vx = -box.vx;
                box.x = clamp_(box.x, 0, ArenaSize);
            }
            if (box.y < 0 || box.y > ArenaSize)
            {
                box.vy = -box.vy;
                box.y = clamp_(box.y, 0, ArenaSize);
            }
        }

        std::uint32_t m_players = 0;
        std::uint64_t m_seed = 0;
    };

    struct Params
    {
        std::uint32_t players = 2;
        std::uint32_t checkDistance = 7;
        std::uint32_t frames = 600;
        std::uint64_t seed = 1;
        framewarp::LogLevel logLevel = framewarp::LogLevel::Warn;
    };

    bool parse_u32(std::string_view s, std::uint32_t &out)
    {
        unsigned long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<std::uint32_t>::max())
        {
            return false;
        }
        out = static_cast<std::uint32_t>(v);
        return true;
    }

    bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "box_game_synctest (local rollback determinism check)\n"
                  << "  --players N\n"
                  << "  --check-distance D\n"
                  << "  --frames F\n"
                  << "  --seed S\n"
                  << "  --log-level error|warn|info|debug|trace|off\n";
        std::exit(2);
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--players")
            {
                if (!parse_u32(need(), p.players))
                    usage_and_exit();
            }
            else if (a == "--check-distance")
            {
                if (!parse_u32(need(), p.checkDistance))
                    usage_and_exit();
            }
            else if (a == "--frames")
            {
                if (!parse_u32(need(), p.frames))
                    usage_and_exit();
            }
            else if (a == "--seed")
            {
                if (!parse_u64(need(), p.seed))
                    usage_and_exit();
            }
            else if (a == "--log-level")
            {
                const auto lvl = framewarp::parse_log_level(need());
                if (!lvl)
                    usage_and_exit();
                p.logLevel = *lvl;
            }
            else
            {
                usage_and_exit();
            }
        }

        if (p.players == 0)
        {
            usage_and_exit();
        }
        return p;
    }
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    auto session = std::make_shared<framewarp::SyncTestSession>(p.players, p.checkDistance, p.checkDistance);

    // The sampler reads the driver's current frame; set once the driver exists.
    framewarp::SessionDriver *driverPtr = nullptr;

    framewarp::DriverConfig cfg;
    cfg.maxPredictionFrames = p.checkDistance;
    cfg.logLevel = p.logLevel;
    cfg.inputSampler = [&](framewarp::PlayerHandle player)
    {
        // Pseudo keyboard: hold a random direction combination for 8 frames at a time.
        const framewarp::Frame frame = driverPtr->current_frame();
        const std::uint64_t r = framewarp::rng_u64(p.seed, frame / 8, InputStream, player);
        return framewarp::input::pack(BoxInput{static_cast<std::uint8_t>(r & 0x0f)});
    };

    std::uint64_t desyncs = 0;
    cfg.eventSink = [&](const framewarp::DriverEvent &ev)
    {
        if (ev.kind == framewarp::DriverEventKind::DesyncDetected)
        {
            ++desyncs;
            std::cerr << "desync at frame " << ev.frame << "\n";
        }
    };

    framewarp::SessionDriver driver(cfg, session, std::make_unique<BoxGame>(p.players, p.seed));
    driverPtr = &driver;
    driver.register_copy<Box>(BoxType, "Box");
    driver.register_copy<Owner>(OwnerType, "Owner");
    driver.start();

    for (std::uint32_t i = 0; i < p.frames; ++i)
    {
        const auto report = driver.tick();
        if (report.terminal())
        {
            std::cerr << "aborted: " << report.fatalMessage << "\n";
            return 1;
        }
    }

    const auto &stats = driver.stats();
    const framewarp::Frame last = driver.store().latest();
    std::cout << "frames=" << driver.current_frame()
              << " players=" << p.players
              << " checkDistance=" << p.checkDistance
              << " loads=" << stats.loads
              << " advances=" << stats.advances
              << " desyncs=" << desyncs
              << " checksum[" << last << "]=" << std::hex << driver.store().load(last).checksum << std::dec << "\n";

    return desyncs == 0 ? 0 : 1;
}
