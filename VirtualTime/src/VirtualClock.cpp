#include <VirtualTime/VirtualClock.hpp>
#include <thread>

namespace reachtrigger::time
{
    Clock::TimePoint SteadyClock::now() const noexcept
    {
        return std::chrono::steady_clock::now();
    }

    void SteadyClock::sleepFor(Duration d)
    {
        if (d > Duration::zero())
            std::this_thread::sleep_for(d);
    }

    VirtualClock::VirtualClock() noexcept = default; // start at zero epoch

    Clock::TimePoint VirtualClock::now() const noexcept
    {
        return TimePoint{Duration{m_ticks.load(std::memory_order_acquire)}};
    }

    void VirtualClock::sleepFor(Duration d)
    {
        advance(d);
    }

    void VirtualClock::advance(Duration delta) noexcept
    {
        if (delta < Duration::zero())
        {
            return;
        }

        m_ticks.fetch_add(delta.count(), std::memory_order_acq_rel);
    }

    void VirtualClock::reset() noexcept
    {
        m_ticks.store(0, std::memory_order_release);
    }

} // namespace reachtrigger::time
