#include <CaptureStream/ScriptedCaptureSource.hpp>
#include <algorithm>

namespace reachtrigger::capture
{
    ScriptedCaptureSource::ScriptedCaptureSource(time::Clock &clock, EndBehavior end)
        : m_clock(clock), m_end(end) {}

    void ScriptedCaptureSource::pushFrame(Frame frame)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script.emplace_back(std::move(frame));
    }

    void ScriptedCaptureSource::pushStall(Duration gap)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script.emplace_back(Stall{gap});
    }

    void ScriptedCaptureSource::pushDisconnect()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_script.emplace_back(Disconnect{});
    }

    void ScriptedCaptureSource::setReconnectResult(bool ok)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_reconnectOk = ok;
    }

    std::size_t ScriptedCaptureSource::reconnectAttempts() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_reconnectAttempts;
    }

    std::size_t ScriptedCaptureSource::pending() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_script.size();
    }

    ReadResult ScriptedCaptureSource::read(std::chrono::milliseconds timeout)
    {
        Duration wait{timeout};
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (!m_connected)
                return {ReadStatus::Disconnected, {}};

            if (m_script.empty())
            {
                if (m_end == EndBehavior::Disconnect)
                {
                    m_connected = false;
                    return {ReadStatus::Disconnected, {}};
                }
            }
            else if (auto *frame = std::get_if<Frame>(&m_script.front()))
            {
                ReadResult result{ReadStatus::Frame, std::move(*frame)};
                m_script.pop_front();
                return result;
            }
            else if (auto *stall = std::get_if<Stall>(&m_script.front()))
            {
                wait = std::min(wait, stall->remaining);
                stall->remaining -= wait;
                if (stall->remaining <= Duration::zero())
                    m_script.pop_front();
            }
            else
            {
                m_script.pop_front();
                m_connected = false;
                return {ReadStatus::Disconnected, {}};
            }
        }

        // Sleep outside the lock so tests can keep scripting while the reader waits.
        m_clock.sleepFor(wait);
        return {ReadStatus::Timeout, {}};
    }

    bool ScriptedCaptureSource::reconnect()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_reconnectAttempts;
        if (m_reconnectOk)
            m_connected = true;
        return m_reconnectOk;
    }

    std::string ScriptedCaptureSource::describe() const
    {
        return "scripted";
    }
} // namespace reachtrigger::capture
