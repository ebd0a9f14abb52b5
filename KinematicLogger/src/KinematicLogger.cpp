#include <KinematicLogger/KinematicLogger.hpp>
#include <Diagnostics/Logging.hpp>

#include <cctype>
#include <iomanip>
#include <type_traits>
#include <variant>

namespace reachtrigger::logging
{
    namespace
    {
        // Free text goes into the last column; keep it on one CSV field.
        std::string sanitize(const std::string &text)
        {
            std::string out = text;
            for (auto &c : out)
            {
                if (c == ',' || c == '\n' || c == '\r')
                    c = ';';
            }
            return out;
        }
    } // namespace

    KinematicLogger::KinematicLogger(const KinematicLoggerConfig &config,
                                     LogChannel &channel,
                                     std::shared_ptr<spdlog::logger> logger)
        : m_config(config), m_channel(channel),
          m_log(diagnostics::resolveLogger(std::move(logger), "kinlog")) {}

    KinematicLogger::~KinematicLogger()
    {
        stop();
    }

    void KinematicLogger::start()
    {
        if (m_running)
            return;

        m_running = true;

        std::error_code ec;
        std::filesystem::create_directories(m_config.outputDir, ec);
        if (ec)
            m_log->error("cannot create output directory {}: {}", m_config.outputDir, ec.message());

        m_channel.subscribe([this](const LogRecord &record, bool lastInBatch)
                            { this->handleRecord(record, lastInBatch); });
    }

    void KinematicLogger::stop()
    {
        if (!m_running)
            return;
        m_running = false;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open())
        {
            m_log->warn("closing incomplete record {}", m_path.string());
            closeLocked(false);
        }
    }

    void KinematicLogger::finalize()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open())
            closeLocked(true);
    }

    std::string KinematicLogger::fileNameFor(int trialId, TrialPhase phase, const std::string &tag)
    {
        std::string name = "trial_" + std::to_string(trialId) + "_" + toString(phase);
        if (!tag.empty())
        {
            std::string safe = tag;
            for (auto &c : safe)
            {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_')
                    c = '_';
            }
            name += "_" + safe;
        }
        return name + ".csv";
    }

    std::filesystem::path KinematicLogger::currentPath() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_path;
    }

    std::size_t KinematicLogger::framesWritten() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_framesWritten;
    }

    std::size_t KinematicLogger::completedRecords() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_completed;
    }

    std::size_t KinematicLogger::writeErrors() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_writeErrors;
    }

    void KinematicLogger::handleRecord(const LogRecord &record, bool lastInBatch)
    {
        std::visit([&](const auto &payload)
                   {
                       using T = std::decay_t<decltype(payload)>;
                       if constexpr (std::is_same_v<T, TrialHeader>)
                           handleHeader(record.sequence, payload);
                       else if constexpr (std::is_same_v<T, Frame>)
                           handleFrame(record.sequence, payload);
                       else if constexpr (std::is_same_v<T, TriggerEvent>)
                           handleEvent(record.sequence, payload);
                       else
                           handleFooter(record.sequence, payload); },
                   record.payload);

        if (lastInBatch)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_file.is_open())
                m_file.flush();
        }
    }

    void KinematicLogger::handleHeader(std::uint64_t seq, const TrialHeader &header)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_file.is_open())
        {
            m_log->warn("trial header arrived before footer of {}; closing it incomplete", m_path.string());
            closeLocked(false);
        }

        m_path = std::filesystem::path(m_config.outputDir) / fileNameFor(header.trialId, header.phase, header.tag);
        m_file.open(m_path, std::ios::out | std::ios::trunc);
        if (!m_file.is_open())
        {
            ++m_writeErrors;
            m_log->error("cannot open kinematic record {}", m_path.string());
            return;
        }

        m_file << std::fixed << std::setprecision(6);
        m_file << "# schema=" << kKinematicSchema << "\n"
               << "# seq=" << seq << "\n"
               << "# trial_id=" << header.trialId << "\n"
               << "# phase=" << toString(header.phase) << "\n";
        if (!header.tag.empty())
            m_file << "# tag=" << header.tag << "\n";
        for (const auto &line : header.configLines)
            m_file << "# config " << line << "\n";
        m_file << "# columns frame,seq,t_us,frame_no,marker_id,x,y,z,valid\n"
               << "# columns event,seq,t_us,kind,zone,latency_us,attempts,detail\n"
               << "# columns end,seq,state,reason,frame_count,dropped_frames\n";

        m_log->debug("opened kinematic record {}", m_path.string());
    }

    void KinematicLogger::handleFrame(std::uint64_t seq, const Frame &frame)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file.is_open())
            return;

        const auto t = toMicros(frame.timestamp);
        if (frame.markers.empty())
        {
            m_file << "frame," << seq << "," << t << "," << frame.frameNumber << ",-1,nan,nan,nan,0\n";
        }
        for (const auto &m : frame.markers)
        {
            m_file << "frame," << seq << "," << t << "," << frame.frameNumber << "," << m.id << ","
                   << m.position.x() << "," << m.position.y() << "," << m.position.z() << ","
                   << (m.valid ? 1 : 0) << "\n";
        }
        ++m_framesWritten;
    }

    void KinematicLogger::handleEvent(std::uint64_t seq, const TriggerEvent &event)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file.is_open())
        {
            m_log->warn("{} event (seq {}) arrived with no open record", toString(event.kind), seq);
            return;
        }

        m_file << "event," << seq << "," << toMicros(event.timestamp) << "," << toString(event.kind) << ","
               << (event.zone ? toString(*event.zone) : "") << ","
               << event.issueLatency.count() << "," << event.attempts << ","
               << sanitize(event.detail) << "\n";
    }

    void KinematicLogger::handleFooter(std::uint64_t seq, const TrialFooter &footer)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file.is_open())
            return;

        m_file << "end," << seq << "," << footer.state << "," << footer.reason << "," << footer.frameCount << ","
               << footer.droppedFrames << "\n";
        if (footer.droppedFrames > 0)
        {
            m_file << "# incomplete dropped_frames=" << footer.droppedFrames << "\n";
            m_log->warn("kinematic record {} is missing {} dropped frame(s)", m_path.string(), footer.droppedFrames);
            closeLocked(false);
            return;
        }
        closeLocked(true);
    }

    void KinematicLogger::closeLocked(bool complete)
    {
        if (complete)
            m_file << "# complete\n";
        m_file.flush();
        if (!m_file.good())
        {
            ++m_writeErrors;
            m_log->error("write to {} failed", m_path.string());
        }
        m_file.close();

        if (complete)
        {
            ++m_completed;
            m_log->info("kinematic record complete: {}", m_path.string());
        }
    }
} // namespace reachtrigger::logging
