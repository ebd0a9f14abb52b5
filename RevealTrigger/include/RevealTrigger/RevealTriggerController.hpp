#pragma once

#include <RevealTrigger/HardwareInterface.hpp>
#include <MotionDetector/OnsetDetector.hpp>
#include <TrialConfig/TrialConfig.hpp>
#include <VirtualTime/VirtualClock.hpp>
#include <ReachTrigger/Messages.hpp>

#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace reachtrigger::trigger
{
    // Turns the first movement onset of a PreReveal trial into exactly one reveal command.
    // Holds the hardware handle for the duration of the trial; nothing else sends to it.
    class RevealTriggerController
    {
    public:
        RevealTriggerController(const config::RevealConfig &config,
                                HardwareInterface &hardware,
                                time::Clock &clock,
                                std::shared_ptr<spdlog::logger> logger = nullptr);

        // Prepares a trial. PreReveal trials occlude the goggles here (when configured) and
        // throw TrialError if occlusion cannot be confirmed.
        void arm(TrialPhase phase);

        // Issues the reveal for the first onset of an armed PreReveal trial and returns the
        // Reveal event, stamped with the onset sample's timestamp. Later onsets, disarmed
        // controllers and FullKnowledge trials return nullopt without touching the hardware.
        // Throws TrialError once all retries are exhausted.
        std::optional<TriggerEvent> onOnset(const detection::OnsetNotification &onset);

        void disarm() noexcept;

        [[nodiscard]] bool armed() const noexcept { return m_armed; }
        [[nodiscard]] bool fired() const noexcept { return m_fired; }
        [[nodiscard]] int revealsIssued() const noexcept { return m_revealsIssued; }

    private:
        SendStatus sendWithRetry(OcclusionState state, int &attempts);

        config::RevealConfig m_config;
        HardwareInterface &m_hardware;
        time::Clock &m_clock;
        std::shared_ptr<spdlog::logger> m_log;

        TrialPhase m_phase{TrialPhase::PreReveal};
        bool m_armed{false};
        bool m_fired{false};
        int m_revealsIssued{0};
    };
} // namespace reachtrigger::trigger
