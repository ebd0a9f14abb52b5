#include <CaptureStream/StreamIngestAdapter.hpp>
#include <Diagnostics/Logging.hpp>

#include <algorithm>

namespace reachtrigger::capture
{
    StreamIngestAdapter::StreamIngestAdapter(const IngestConfig &config,
                                             CaptureSource &source,
                                             time::Clock &clock,
                                             std::shared_ptr<spdlog::logger> logger)
        : m_config(config), m_source(source), m_clock(clock),
          m_log(diagnostics::resolveLogger(std::move(logger), "capture"))
    {
        if (m_config.queueCapacity == 0)
            m_config.queueCapacity = 1;
    }

    StreamIngestAdapter::~StreamIngestAdapter()
    {
        stop();
    }

    void StreamIngestAdapter::start()
    {
        bool expected = false;
        if (!m_running.compare_exchange_strong(expected, true))
            return; // already running

        m_producing = true;
        m_worker = std::jthread([this](std::stop_token st)
                                { workerLoop(st); });
        m_log->info("ingest started from {}", m_source.describe());
    }

    void StreamIngestAdapter::stop()
    {
        if (!m_running.exchange(false))
            return;

        if (m_worker.joinable())
        {
            m_worker.request_stop();
            m_spaceCv.notify_all();
            m_worker.join();
        }
        m_producing = false;
    }

    bool StreamIngestAdapter::restart()
    {
        stop();
        if (!m_source.reconnect())
        {
            m_log->error("capture source {} could not be reconnected", m_source.describe());
            return false;
        }
        start();
        return true;
    }

    std::optional<IngestItem> StreamIngestAdapter::next(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_itemCv.wait_for(lock, timeout, [&]
                               { return !m_queue.empty(); }))
        {
            return std::nullopt;
        }

        IngestItem item = std::move(m_queue.front());
        m_queue.pop_front();
        lock.unlock();
        m_spaceCv.notify_one();
        return item;
    }

    std::size_t StreamIngestAdapter::discardPending()
    {
        std::size_t n = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            n = m_queue.size();
            m_queue.clear();
        }
        m_spaceCv.notify_all();
        return n;
    }

    void StreamIngestAdapter::push(IngestItem item, const std::stop_token &st)
    {
        {
            std::unique_lock<std::mutex> lock(m_mutex);

            if (m_queue.size() >= m_config.queueCapacity && m_config.overflowPolicy == OverflowPolicy::Block)
            {
                m_spaceCv.wait_for(lock, m_config.readTimeout, [&]
                                   { return m_queue.size() < m_config.queueCapacity || st.stop_requested(); });
            }

            if (m_queue.size() >= m_config.queueCapacity)
            {
                m_queue.pop_front();
                const auto dropped = ++m_dropped;
                if (dropped == 1 || dropped % 100 == 0)
                    m_log->warn("ingest queue full, dropped {} item(s) so far", dropped);
            }

            m_queue.push_back(std::move(item));
        }
        m_itemCv.notify_one();
    }

    bool StreamIngestAdapter::recover(const std::stop_token &st)
    {
        const auto deadline = m_clock.now() + m_config.reconnectBudget;
        auto backoff = std::max<time::Clock::Duration>(m_config.reconnectBackoff, std::chrono::milliseconds(1));
        int attempt = 0;

        while (!st.stop_requested() && m_clock.now() < deadline)
        {
            ++attempt;
            if (m_source.reconnect())
            {
                m_log->info("capture source reconnected after {} attempt(s)", attempt);
                return true;
            }

            const auto remaining = deadline - m_clock.now();
            if (remaining <= time::Clock::Duration::zero())
                break;
            m_clock.sleepFor(std::min(backoff, remaining));
            backoff = std::min<time::Clock::Duration>(backoff * 2, std::chrono::seconds(1));
        }
        return false;
    }

    void StreamIngestAdapter::workerLoop(std::stop_token st)
    {
        auto lastFrameWall = m_clock.now();
        bool stalled = false;

        while (!st.stop_requested())
        {
            ReadResult r = m_source.read(m_config.readTimeout);

            if (r.status == ReadStatus::Frame)
            {
                lastFrameWall = m_clock.now();
                stalled = false;

                if (m_lastTimestamp && r.frame.timestamp <= *m_lastTimestamp)
                {
                    ++m_outOfOrder;
                    m_log->warn("out-of-order frame {} discarded", r.frame.frameNumber);
                    push(StreamFault{r.frame.timestamp, *m_lastTimestamp, r.frame.frameNumber}, st);
                    continue;
                }

                m_lastTimestamp = r.frame.timestamp;
                ++m_delivered;
                push(std::move(r.frame), st);
                continue;
            }

            if (r.status == ReadStatus::Disconnected)
            {
                m_log->error("capture source {} disconnected", m_source.describe());
                push(StreamLost{"capture source disconnected"}, st);
                break;
            }

            const auto gap = m_clock.now() - lastFrameWall;
            if (!stalled && gap > m_config.missedFrameTimeout)
            {
                stalled = true;
                m_log->warn("capture stream stalled ({} ms without a frame)",
                            std::chrono::duration_cast<std::chrono::milliseconds>(gap).count());
                push(StreamStall{gap}, st);

                if (!recover(st))
                {
                    if (st.stop_requested())
                        break;
                    m_log->error("capture source not recovered within {} ms", m_config.reconnectBudget.count());
                    push(StreamLost{"reconnect budget exhausted"}, st);
                    break;
                }

                // Reconnected: start a new stall episode from here.
                lastFrameWall = m_clock.now();
                stalled = false;
            }
        }

        m_producing = false;
    }
} // namespace reachtrigger::capture
