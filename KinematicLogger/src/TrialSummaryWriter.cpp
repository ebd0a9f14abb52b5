#include <KinematicLogger/TrialSummaryWriter.hpp>

#include <fstream>
#include <system_error>

namespace reachtrigger::logging
{
    namespace
    {
        void writeMicros(std::ostream &out, const std::optional<std::chrono::microseconds> &value)
        {
            if (value)
                out << value->count();
        }
    } // namespace

    TrialSummaryWriter::TrialSummaryWriter(const std::string &outputDir)
        : m_path(std::filesystem::path(outputDir) / "trials.csv") {}

    bool TrialSummaryWriter::append(const TrialSummaryRow &row)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
        const bool fresh = !std::filesystem::exists(m_path, ec) || std::filesystem::file_size(m_path, ec) == 0;

        std::ofstream out(m_path, std::ios::out | std::ios::app);
        if (!out.is_open())
            return false;

        if (fresh)
        {
            out << "trial_id,phase,tag,state,reason,frame_count,response_time_us,movement_time_us,"
                   "reveal_time_us,grasped_zone,reveal_latency_us\n";
        }

        out << row.trialId << "," << toString(row.phase) << "," << row.tag << "," << row.state << ","
            << row.reason << "," << row.frameCount << ",";
        writeMicros(out, row.responseTime);
        out << ",";
        writeMicros(out, row.movementTime);
        out << ",";
        writeMicros(out, row.revealTime);
        out << "," << (row.graspedZone ? toString(*row.graspedZone) : "") << ",";
        writeMicros(out, row.revealLatency);
        out << "\n";

        out.flush();
        return out.good();
    }
} // namespace reachtrigger::logging
