// ============= include/database/history_sink.hpp =============
/*
 * History Sink - registro append-only de cada RecognitionRun
 *
 * El orquestador llama append() una vez por run (no cancelado).
 * append() puede lanzar; el orquestador lo loguea y lo descarta.
 */

#pragma once
#include "core/types.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace facematch {

class HistorySink {
public:
    virtual ~HistorySink() = default;
    virtual void append(const RecognitionRun& run) = 0;
};

// Ring acotado en memoria (tests y hosts sin base de datos)
class MemoryHistorySink : public HistorySink {
private:
    std::deque<RecognitionRun> runs;
    mutable std::mutex runs_mutex;
    size_t capacity;

public:
    explicit MemoryHistorySink(size_t capacity = 1000) : capacity(capacity) {}

    void append(const RecognitionRun& run) override;

    // Mas reciente primero
    std::vector<RecognitionRun> recent(size_t limit = 50) const;
    size_t size() const;
};

// Serializa los resultados por cara como JSON (columna recognized_faces)
std::string faces_to_json(const std::vector<MatchResult>& faces);

std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace facematch
