#pragma once

#include "log.hpp"
#include "session.hpp"

#include <map>

namespace framewarp
{
    // Single-machine determinism harness. Every player is local. Once `checkDistance` frames
    // have been simulated, each advance rolls back `checkDistance` frames and resimulates them
    // with the recorded inputs; the checksum of every re-saved frame must match the checksum
    // it had the first time, otherwise a DesyncDetected event is raised.
    class SyncTestSession final : public ISession
    {
    public:
        SyncTestSession(std::size_t numPlayers, std::uint32_t checkDistance, std::size_t maxPredictionFrames = 8)
            : m_numPlayers(numPlayers), m_checkDistance(checkDistance), m_maxPrediction(maxPredictionFrames)
        {
            if (numPlayers == 0)
            {
                throw ConfigurationError("SyncTestSession: numPlayers must be non-zero");
            }
            if (checkDistance > maxPredictionFrames)
            {
                throw ConfigurationError("SyncTestSession: checkDistance=" + std::to_string(checkDistance) +
                                         " exceeds maxPredictionFrames=" + std::to_string(maxPredictionFrames));
            }
            m_pending.resize(numPlayers);
            m_events.push_back(SessionEvent{SessionEventKind::Synchronized, 0, 0, 0, 0, 0});
        }

        SessionState state() const override { return SessionState::Running; }
        std::size_t num_players() const override { return m_numPlayers; }
        std::size_t max_prediction() const override { return m_maxPrediction; }

        // The next advance_frame loads frame `m_frame - checkDistance` at the earliest.
        Frame confirmed_frame() const override
        {
            return std::max(NullFrame, m_frame - static_cast<Frame>(m_checkDistance) - 1);
        }

        std::vector<PlayerHandle> local_players() const override
        {
            std::vector<PlayerHandle> out;
            out.reserve(m_numPlayers);
            for (std::size_t i = 0; i < m_numPlayers; ++i)
            {
                out.push_back(static_cast<PlayerHandle>(i));
            }
            return out;
        }

        void add_local_input(PlayerHandle player, ByteBuffer input) override
        {
            if (player >= m_numPlayers)
            {
                throw ConfigurationError("SyncTestSession: invalid player handle " + std::to_string(player));
            }
            m_pending[player] = std::move(input);
        }

        AdvanceResult advance_frame() override
        {
            AdvanceResult result;

            std::vector<PlayerInput> inputs;
            inputs.reserve(m_numPlayers);
            for (auto &bytes : m_pending)
            {
                inputs.push_back(PlayerInput{std::move(bytes), InputStatus::Confirmed});
                bytes.clear();
            }
            m_inputs[m_frame] = inputs;

            if (m_checkDistance > 0 && m_frame >= static_cast<Frame>(m_checkDistance))
            {
                // Roll back and resimulate; every frame up to the current one is saved again.
                const Frame from = m_frame - static_cast<Frame>(m_checkDistance);
                result.requests.push_back(Request::load(from));
                for (Frame f = from; f < m_frame; ++f)
                {
                    result.requests.push_back(Request::advance(f, m_inputs.at(f)));
                    result.requests.push_back(Request::save(f + 1));
                }
            }
            else
            {
                result.requests.push_back(Request::save(m_frame));
            }
            result.requests.push_back(Request::advance(m_frame, std::move(inputs)));

            ++m_frame;
            forget_before_(m_frame - static_cast<Frame>(m_checkDistance) - 1);
            return result;
        }

        void confirm_frame(Frame frame, std::uint64_t checksum) override
        {
            auto it = m_checksums.find(frame);
            if (it == m_checksums.end())
            {
                m_checksums.emplace(frame, checksum);
                return;
            }
            if (it->second != checksum)
            {
                Logger::instance().logf(LogLevel::Warn, frame, "synctest", "checksum mismatch first=%016llx resimulated=%016llx",
                                        static_cast<unsigned long long>(it->second),
                                        static_cast<unsigned long long>(checksum));
                SessionEvent ev;
                ev.kind = SessionEventKind::DesyncDetected;
                ev.frame = frame;
                ev.localChecksum = it->second;
                ev.remoteChecksum = checksum;
                m_events.push_back(ev);
            }
        }

        std::vector<SessionEvent> drain_events() override
        {
            std::vector<SessionEvent> out;
            out.swap(m_events);
            return out;
        }

        Frame current_frame() const noexcept { return m_frame; }
        std::uint32_t check_distance() const noexcept { return m_checkDistance; }

    private:
        void forget_before_(Frame frame)
        {
            m_inputs.erase(m_inputs.begin(), m_inputs.lower_bound(frame));
            m_checksums.erase(m_checksums.begin(), m_checksums.lower_bound(frame));
        }

        std::size_t m_numPlayers = 0;
        std::uint32_t m_checkDistance = 0;
        std::size_t m_maxPrediction = 0;
        Frame m_frame = 0;

        std::vector<ByteBuffer> m_pending;
        std::map<Frame, std::vector<PlayerInput>> m_inputs;
        std::map<Frame, std::uint64_t> m_checksums;
        std::vector<SessionEvent> m_events;
    };
}
