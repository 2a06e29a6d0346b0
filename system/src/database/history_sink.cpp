// ============= src/database/history_sink.cpp =============
#include "database/history_sink.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace facematch {

// ==================== MEMORY SINK ====================

void MemoryHistorySink::append(const RecognitionRun& run) {
    std::lock_guard<std::mutex> lock(runs_mutex);
    runs.push_back(run);
    while (runs.size() > capacity) {
        runs.pop_front();
    }
}

std::vector<RecognitionRun> MemoryHistorySink::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(runs_mutex);

    std::vector<RecognitionRun> out;
    for (auto it = runs.rbegin(); it != runs.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

size_t MemoryHistorySink::size() const {
    std::lock_guard<std::mutex> lock(runs_mutex);
    return runs.size();
}

// ==================== JSON ====================

namespace {

std::string escape_json(const std::string& s) {
    std::ostringstream out;
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

} // namespace

std::string faces_to_json(const std::vector<MatchResult>& faces) {
    std::ostringstream json;
    json << "[";

    for (size_t i = 0; i < faces.size(); i++) {
        const auto& f = faces[i];
        const auto& b = f.observation.box;

        if (i > 0) json << ",";
        json << "{";
        json << "\"face_index\":" << f.observation.index << ",";

        if (f.matched_entry_id) {
            json << "\"id\":" << *f.matched_entry_id << ",";
        } else {
            json << "\"id\":null,";
        }

        json << "\"name\":\"" << escape_json(f.is_known ? f.matched_label : "Unknown") << "\",";
        json << "\"confidence\":" << std::fixed << std::setprecision(2) << f.confidence << ",";

        if (f.raw_distance) {
            json << "\"distance\":" << std::setprecision(4) << *f.raw_distance << ",";
        } else {
            json << "\"distance\":null,";
        }

        json << "\"face_location\":[" << b.top << "," << b.right << ","
             << b.bottom << "," << b.left << "]";

        for (const auto& [key, value] : f.attributes) {
            json << ",\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
        }

        if (!f.error.empty()) {
            json << ",\"error\":\"" << escape_json(f.error) << "\"";
        }

        json << "}";
    }

    json << "]";
    return json.str();
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_now = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

} // namespace facematch
