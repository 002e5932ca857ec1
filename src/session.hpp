#pragma once

#include "common.hpp"

namespace framewarp
{
    enum class InputStatus : std::uint8_t
    {
        Confirmed = 0,
        Predicted = 1,
        Disconnected = 2,
    };

    struct PlayerInput
    {
        ByteBuffer bytes;
        InputStatus status = InputStatus::Confirmed;
    };

    enum class RequestKind : std::uint8_t
    {
        Save = 1,
        Load = 2,
        Advance = 3,
    };

    struct Request
    {
        RequestKind kind = RequestKind::Advance;
        Frame frame = NullFrame;
        // One entry per player, Advance only.
        std::vector<PlayerInput> inputs;

        static Request save(Frame f) { return Request{RequestKind::Save, f, {}}; }
        static Request load(Frame f) { return Request{RequestKind::Load, f, {}}; }
        static Request advance(Frame f, std::vector<PlayerInput> inputs) { return Request{RequestKind::Advance, f, std::move(inputs)}; }
    };

    inline const char *request_kind_name(RequestKind k) noexcept
    {
        switch (k)
        {
        case RequestKind::Save:
            return "Save";
        case RequestKind::Load:
            return "Load";
        case RequestKind::Advance:
            return "Advance";
        }
        return "Unknown";
    }

    enum class SessionEventKind : std::uint8_t
    {
        Synchronized = 1,
        PlayerDisconnected = 2,
        DesyncDetected = 3,
        // The local peer is ahead; the driver should skip `skipFrames` ticks.
        WaitRecommendation = 4,
    };

    struct SessionEvent
    {
        SessionEventKind kind = SessionEventKind::Synchronized;
        PlayerHandle player = 0;
        Frame frame = NullFrame;
        std::uint64_t localChecksum = 0;
        std::uint64_t remoteChecksum = 0;
        std::uint32_t skipFrames = 0;
    };

    enum class SessionState : std::uint8_t
    {
        Synchronizing = 0,
        Running = 1,
    };

    enum class AdvanceStatus : std::uint8_t
    {
        Ok = 0,
        // Too far ahead of confirmed remote input. Not an error; try again next tick.
        PredictionThreshold = 1,
    };

    struct AdvanceResult
    {
        AdvanceStatus status = AdvanceStatus::Ok;
        std::vector<Request> requests;
    };

    // The external synchronization protocol. It owns the network, input exchange and the
    // decision of when and how far to roll back; the driver only executes its requests.
    //
    // Every call is made from the driver's thread at tick boundaries. An implementation
    // that runs background I/O must hand out settled request lists.
    class ISession
    {
    public:
        virtual ~ISession() = default;

        virtual SessionState state() const = 0;
        virtual std::size_t num_players() const = 0;
        virtual std::vector<PlayerHandle> local_players() const = 0;

        // Deepest rollback the session may request, in frames. SessionDriver::start refuses a
        // session that asks for more than the snapshot store can hold.
        virtual std::size_t max_prediction() const = 0;

        // Newest frame whose advance will never be resimulated, or NullFrame.
        virtual Frame confirmed_frame() const = 0;

        virtual void add_local_input(PlayerHandle player, ByteBuffer input) = 0;

        // Pump the network. Called once per tick whether or not the session is running.
        virtual void poll_remote() {}

        // How many frames the local peer is ahead of the remotes.
        virtual std::int32_t frames_ahead() const { return 0; }

        virtual AdvanceResult advance_frame() = 0;

        // Reports the checksum of a Save the driver just executed.
        virtual void confirm_frame(Frame frame, std::uint64_t checksum) = 0;

        virtual std::vector<SessionEvent> drain_events() = 0;
    };
}
