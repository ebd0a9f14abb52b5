#include <KinematicLogger/LogChannel.hpp>
#include <Diagnostics/Logging.hpp>

namespace reachtrigger::logging
{
    LogChannel::LogChannel(const LogChannelConfig &config, std::shared_ptr<spdlog::logger> logger)
        : m_config(config),
          m_log(diagnostics::resolveLogger(std::move(logger), "kinlog")),
          m_frames(config.frameCapacity > 0 ? config.frameCapacity : 1),
          m_control(config.controlCapacity > 0 ? config.controlCapacity : 1) {}

    LogChannel::~LogChannel()
    {
        stop();
    }

    // Start worker thread
    void LogChannel::start()
    {
        bool expected = false;
        if (!m_running.compare_exchange_strong(expected, true))
            return; // already running

        m_worker = std::jthread([this](std::stop_token st)
                                { workerLoop(st); });
    }

    void LogChannel::stop()
    {
        if (!m_running.exchange(false))
            return;

        if (m_worker.joinable())
        {
            m_worker.request_stop();
            m_worker.join();
        }

        // Worker is gone; this thread is now the only consumer.
        for (;;)
        {
            drainSpill(m_control, m_controlSpill);
            drainSpill(m_frames, m_frameSpill);
            if (consumeAvailable() == 0 && m_controlSpill.empty() && m_frameSpill.empty())
                break;
        }
    }

    void LogChannel::subscribe(RecordHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        m_handlers.emplace_back(std::move(handler));
    }

    void LogChannel::drainSpill(Queue &queue, std::deque<LogRecord> &spill)
    {
        while (!spill.empty() && queue.push(spill.front()))
        {
            markVisible(spill.front().sequence);
            spill.pop_front();
            ++m_enqueued;
        }
    }

    void LogChannel::publish(const Frame &frame)
    {
        LogRecord rec{m_nextSequence++, frame};

        if (!m_frameSpill.empty())
            drainSpill(m_frames, m_frameSpill);

        if (m_frameSpill.empty() && m_frames.push(rec))
        {
            markVisible(rec.sequence);
            ++m_enqueued;
            if (m_degraded.exchange(false))
                m_log->info("logger caught up, leaving degraded mode");
            return;
        }

        if (!m_degraded.exchange(true))
        {
            ++m_episodes;
            m_log->warn("LoggerBackpressure: frame queue full, frame persistence is lagging");
        }

        if (m_frameSpill.size() < m_config.spillLimit)
        {
            m_frameSpill.push_back(std::move(rec));
        }
        else
        {
            const auto dropped = ++m_droppedFrames;
            if (dropped == 1 || dropped % 100 == 0)
                m_log->error("LoggerBackpressure: spill buffer full, {} frame(s) not persisted", dropped);
        }
    }

    void LogChannel::publish(const TriggerEvent &event)
    {
        publishControl(event);
    }

    void LogChannel::publish(const TrialHeader &header)
    {
        publishControl(header);
    }

    void LogChannel::publish(const TrialFooter &footer)
    {
        publishControl(footer);
    }

    void LogChannel::publishControl(LogPayload payload)
    {
        LogRecord rec{m_nextSequence++, std::move(payload)};

        if (!m_controlSpill.empty())
            drainSpill(m_control, m_controlSpill);

        if (m_controlSpill.empty() && m_control.push(rec))
        {
            markVisible(rec.sequence);
            ++m_enqueued;
            return;
        }

        // Control records are few and small; keep all of them.
        if (m_controlSpill.empty())
            m_log->warn("LoggerBackpressure: control queue full, holding events");
        m_controlSpill.push_back(std::move(rec));
    }

    bool LogChannel::flush(std::chrono::milliseconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        for (;;)
        {
            drainSpill(m_control, m_controlSpill);
            drainSpill(m_frames, m_frameSpill);

            const bool spillsEmpty = m_controlSpill.empty() && m_frameSpill.empty();
            if (spillsEmpty && m_consumed.load() == m_enqueued.load())
            {
                if (m_degraded.exchange(false))
                    m_log->info("logger caught up, leaving degraded mode");
                return true;
            }

            if (!m_running.load() || std::chrono::steady_clock::now() >= deadline)
                return false;

            std::this_thread::sleep_for(m_config.idleSleep);
        }
    }

    void LogChannel::markVisible(std::uint64_t sequence)
    {
        // Producer only; spilled frames re-enter with older sequence numbers.
        if (sequence > m_visibleSequence.load(std::memory_order_relaxed))
            m_visibleSequence.store(sequence, std::memory_order_release);
    }

    std::size_t LogChannel::consumeAvailable()
    {
        std::size_t handled = 0;

        for (;;)
        {
            // Everything pushed up to this sequence is visible in its queue, so the lower
            // front among eligible records is the next one in publish order.
            const std::uint64_t limit = m_visibleSequence.load(std::memory_order_acquire);
            const bool controlReady = m_control.read_available() > 0 && m_control.front().sequence <= limit;
            const bool framesReady = m_frames.read_available() > 0 && m_frames.front().sequence <= limit;
            if (!controlReady && !framesReady)
                break;

            Queue *source = nullptr;
            if (controlReady && framesReady)
                source = m_control.front().sequence < m_frames.front().sequence ? &m_control : &m_frames;
            else
                source = controlReady ? &m_control : &m_frames;

            const bool lastInBatch = !(controlReady && framesReady) && source->read_available() == 1;
            const LogRecord &rec = source->front();
            for (auto &h : m_handlers)
            {
                if (h)
                {
                    h(rec, lastInBatch);
                }
            }

            source->pop();
            ++m_consumed;
            ++handled;
        }

        return handled;
    }

    void LogChannel::workerLoop(std::stop_token st)
    {
        while (!st.stop_requested())
        {
            if (consumeAvailable() == 0)
                std::this_thread::sleep_for(m_config.idleSleep);
        }
    }
} // namespace reachtrigger::logging
