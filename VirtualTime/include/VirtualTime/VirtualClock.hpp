#pragma once

#include <atomic>
#include <chrono>

namespace reachtrigger::time
{
    /// Source of wall time for timeouts, backoff and latency measurement.
    /// Components never call std::chrono::steady_clock::now() directly so that tests
    /// can substitute a VirtualClock.
    class Clock
    {
    public:
        using TimePoint = std::chrono::steady_clock::time_point;
        using Duration = std::chrono::steady_clock::duration;

        virtual ~Clock() = default;

        [[nodiscard]] virtual TimePoint now() const noexcept = 0;

        /// Suspends the caller for the given duration (or advances virtual time).
        virtual void sleepFor(Duration d) = 0;
    };

    class SteadyClock final : public Clock
    {
    public:
        [[nodiscard]] TimePoint now() const noexcept override;
        void sleepFor(Duration d) override;
    };

    /// Deterministic clock. Starts at the zero epoch and only moves when advanced;
    /// sleepFor() advances instead of blocking. Safe to share between threads.
    class VirtualClock final : public Clock
    {
    public:
        VirtualClock() noexcept;

        [[nodiscard]] TimePoint now() const noexcept override;
        void sleepFor(Duration d) override;

        /// Advances the virtual time by the given duration.
        /// Negative deltas are ignored
        void advance(Duration delta) noexcept;

        /// Resets the clock back to the initial epoch.
        void reset() noexcept;

    private:
        std::atomic<Duration::rep> m_ticks{0};
    };
} // namespace reachtrigger::time
