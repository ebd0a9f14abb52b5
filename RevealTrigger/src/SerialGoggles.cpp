#include <RevealTrigger/SerialGoggles.hpp>
#include <Diagnostics/Logging.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace reachtrigger::trigger
{
    namespace
    {
        bool toSpeed(int baud, speed_t &out)
        {
            switch (baud)
            {
            case 9600:
                out = B9600;
                return true;
            case 19200:
                out = B19200;
                return true;
            case 38400:
                out = B38400;
                return true;
            case 57600:
                out = B57600;
                return true;
            case 115200:
                out = B115200;
                return true;
            default:
                return false;
            }
        }
    } // namespace

    SerialGoggles::SerialGoggles(const SerialConfig &config, std::shared_ptr<spdlog::logger> logger)
        : m_config(config), m_log(diagnostics::resolveLogger(std::move(logger), "trigger")) {}

    SerialGoggles::~SerialGoggles()
    {
        disconnect();
    }

    bool SerialGoggles::connect()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_fd >= 0)
            return true;

        speed_t speed{};
        if (!toSpeed(m_config.baud, speed))
        {
            m_log->error("unsupported baud rate {}", m_config.baud);
            return false;
        }

        const int fd = ::open(m_config.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd < 0)
        {
            m_log->error("cannot open {}: {}", m_config.device, std::strerror(errno));
            return false;
        }

        termios tty{};
        if (tcgetattr(fd, &tty) != 0)
        {
            m_log->error("tcgetattr on {} failed: {}", m_config.device, std::strerror(errno));
            ::close(fd);
            return false;
        }

        cfmakeraw(&tty);
        cfsetispeed(&tty, speed);
        cfsetospeed(&tty, speed);
        tty.c_cflag |= (CLOCAL | CREAD);
        tty.c_cflag &= ~CSTOPB;
        tty.c_cflag &= ~CRTSCTS;

        if (tcsetattr(fd, TCSANOW, &tty) != 0)
        {
            m_log->error("tcsetattr on {} failed: {}", m_config.device, std::strerror(errno));
            ::close(fd);
            return false;
        }
        tcflush(fd, TCIOFLUSH);

        m_fd = fd;
        m_log->info("goggle controller connected on {} @ {} baud", m_config.device, m_config.baud);
        return true;
    }

    void SerialGoggles::disconnect()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_fd >= 0)
        {
            ::close(m_fd);
            m_fd = -1;
        }
    }

    bool SerialGoggles::isConnected() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_fd >= 0;
    }

    std::string SerialGoggles::describe() const
    {
        return "serial:" + m_config.device;
    }

    SendStatus SerialGoggles::setOcclusionState(OcclusionState state)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_fd < 0)
            return SendStatus::Failed;

        const std::string &payload = state == OcclusionState::Open ? m_config.openCommand : m_config.closeCommand;

        // Discard stale replies so the ack we wait for belongs to this command.
        if (m_config.expectAck)
            tcflush(m_fd, TCIFLUSH);

        const SendStatus written = writeAll(payload);
        if (written != SendStatus::Acknowledged)
            return written;

        if (tcdrain(m_fd) != 0)
        {
            m_log->warn("tcdrain failed: {}", std::strerror(errno));
            return SendStatus::Failed;
        }

        return m_config.expectAck ? awaitAck() : SendStatus::Acknowledged;
    }

    SendStatus SerialGoggles::writeAll(const std::string &payload)
    {
        std::size_t offset = 0;
        while (offset < payload.size())
        {
            const ssize_t n = ::write(m_fd, payload.data() + offset, payload.size() - offset);
            if (n > 0)
            {
                offset += static_cast<std::size_t>(n);
                continue;
            }

            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
            {
                m_log->warn("serial write failed: {}", std::strerror(errno));
                return SendStatus::Failed;
            }

            pollfd pfd{m_fd, POLLOUT, 0};
            const int ready = ::poll(&pfd, 1, static_cast<int>(m_config.writeTimeout.count()));
            if (ready == 0)
                return SendStatus::Timeout;
            if (ready < 0 && errno != EINTR)
                return SendStatus::Failed;
        }
        return SendStatus::Acknowledged;
    }

    SendStatus SerialGoggles::awaitAck()
    {
        pollfd pfd{m_fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(m_config.ackTimeout.count()));
        if (ready == 0)
            return SendStatus::Timeout;
        if (ready < 0)
            return SendStatus::Failed;

        char buf[16];
        const ssize_t n = ::read(m_fd, buf, sizeof(buf));
        return n > 0 ? SendStatus::Acknowledged : SendStatus::Failed;
    }
} // namespace reachtrigger::trigger
