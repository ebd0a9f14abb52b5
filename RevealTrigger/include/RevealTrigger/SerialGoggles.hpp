#pragma once

#include <RevealTrigger/HardwareInterface.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

namespace reachtrigger::trigger
{
    struct SerialConfig
    {
        std::string device = "/dev/ttyACM0";
        int baud = 9600;
        std::string openCommand = "55";
        std::string closeCommand = "56";
        std::chrono::milliseconds writeTimeout{10};
        bool expectAck = false; // wait for any reply byte from the controller
        std::chrono::milliseconds ackTimeout{20};
    };

    // Goggle controller on a serial line (POSIX termios, raw 8N1).
    class SerialGoggles final : public HardwareInterface
    {
    public:
        explicit SerialGoggles(const SerialConfig &config, std::shared_ptr<spdlog::logger> logger = nullptr);
        ~SerialGoggles() override;

        SerialGoggles(const SerialGoggles &) = delete;
        SerialGoggles &operator=(const SerialGoggles &) = delete;

        bool connect();
        void disconnect();

        SendStatus setOcclusionState(OcclusionState state) override;
        [[nodiscard]] bool isConnected() const override;
        [[nodiscard]] std::string describe() const override;

    private:
        SendStatus writeAll(const std::string &payload);
        SendStatus awaitAck();

        SerialConfig m_config;
        std::shared_ptr<spdlog::logger> m_log;

        mutable std::mutex m_mutex;
        int m_fd = -1;
    };
} // namespace reachtrigger::trigger
