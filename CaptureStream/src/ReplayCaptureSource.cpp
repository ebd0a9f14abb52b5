#include <CaptureStream/ReplayCaptureSource.hpp>
#include <ReachTrigger/Errors.hpp>

#include <cmath>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace reachtrigger::capture
{
    namespace
    {
        std::vector<std::string> splitCsv(const std::string &line)
        {
            std::vector<std::string> cells;
            std::stringstream ss(line);
            std::string cell;
            while (std::getline(ss, cell, ','))
            {
                while (!cell.empty() && (cell.back() == '\r' || cell.back() == ' '))
                    cell.pop_back();
                while (!cell.empty() && cell.front() == ' ')
                    cell.erase(cell.begin());
                cells.push_back(cell);
            }
            return cells;
        }

        bool parseBool(const std::string &s)
        {
            return !(s == "0" || s == "false" || s == "False" || s == "FALSE");
        }
    } // namespace

    ReplayCaptureSource::ReplayCaptureSource(const ReplayConfig &config, time::Clock &clock)
        : m_config(config), m_clock(clock)
    {
        load();
    }

    void ReplayCaptureSource::load()
    {
        std::ifstream in(m_config.path);
        if (!in.good())
            throw ConfigError("capture replay file not found: " + m_config.path);

        if (!(m_config.sampleRateHz > 0.0))
            throw ConfigError("capture sample_rate must be > 0");

        std::string line;
        if (!std::getline(in, line))
            throw ConfigError("capture replay file is empty: " + m_config.path);

        std::unordered_map<std::string, std::size_t> columns;
        const auto header = splitCsv(line);
        for (std::size_t i = 0; i < header.size(); ++i)
            columns[header[i]] = i;

        for (const char *required : {"frame", "pos_x", "pos_y", "pos_z"})
        {
            if (!columns.count(required))
                throw ConfigError("capture replay file must contain columns frame, pos_x, pos_y, pos_z");
        }

        auto optionalColumn = [&](std::initializer_list<const char *> names) -> std::optional<std::size_t>
        {
            for (const char *n : names)
            {
                auto it = columns.find(n);
                if (it != columns.end())
                    return it->second;
            }
            return std::nullopt;
        };
        const auto tsCol = optionalColumn({"timestamp", "time"});
        const auto idCol = optionalColumn({"id", "marker_id"});
        const auto validCol = optionalColumn({"valid"});

        const std::size_t frameCol = columns["frame"];
        const std::size_t xCol = columns["pos_x"];
        const std::size_t yCol = columns["pos_y"];
        const std::size_t zCol = columns["pos_z"];

        std::size_t lineNo = 1;
        while (std::getline(in, line))
        {
            ++lineNo;
            if (line.empty() || line[0] == '#')
                continue;

            const auto cells = splitCsv(line);
            try
            {
                const auto frameNo = static_cast<std::uint64_t>(std::stoull(cells.at(frameCol)));

                if (m_frames.empty() || m_frames.back().frameNumber != frameNo)
                {
                    Frame f;
                    f.frameNumber = frameNo;
                    const double seconds = tsCol ? std::stod(cells.at(*tsCol))
                                                 : static_cast<double>(frameNo) / m_config.sampleRateHz;
                    f.timestamp = TimePoint{std::chrono::duration_cast<Duration>(std::chrono::duration<double>(seconds))};
                    m_frames.push_back(std::move(f));
                }

                MarkerSample m;
                m.id = idCol ? std::stoi(cells.at(*idCol)) : static_cast<int>(m_frames.back().markers.size()) + 1;
                m.position = Eigen::Vector3f(std::stof(cells.at(xCol)),
                                             std::stof(cells.at(yCol)),
                                             std::stof(cells.at(zCol)));
                m.valid = validCol ? parseBool(cells.at(*validCol)) : m.position.allFinite();
                m_frames.back().markers.push_back(std::move(m));
            }
            catch (const std::exception &e)
            {
                throw ConfigError("capture replay file " + m_config.path + " line " + std::to_string(lineNo) +
                                  ": " + e.what());
            }
        }
    }

    ReadResult ReplayCaptureSource::read(std::chrono::milliseconds timeout)
    {
        if (m_next >= m_frames.size())
            return {ReadStatus::Disconnected, {}}; // end of recording

        if (m_config.realtime)
        {
            const auto now = m_clock.now();
            if (!m_wallStart)
                m_wallStart = now;

            const auto due = *m_wallStart + (m_frames[m_next].timestamp - m_frames.front().timestamp);
            if (due > now)
            {
                if (due - now > timeout)
                {
                    m_clock.sleepFor(timeout);
                    return {ReadStatus::Timeout, {}};
                }
                m_clock.sleepFor(due - now);
            }
        }

        return {ReadStatus::Frame, m_frames[m_next++]};
    }

    bool ReplayCaptureSource::reconnect()
    {
        return m_next < m_frames.size();
    }

    std::string ReplayCaptureSource::describe() const
    {
        return "replay:" + m_config.path;
    }

    void ReplayCaptureSource::rewind() noexcept
    {
        m_next = 0;
        m_wallStart.reset();
    }
} // namespace reachtrigger::capture
