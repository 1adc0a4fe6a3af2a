#pragma once

#include "fitting/slot_result.h"

#include <atomic>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace subdub {
namespace metrics {

// Point-in-time copy of the run counters.
struct RunStats {
    std::size_t total = 0;
    std::size_t generated = 0;
    std::size_t cached = 0;
    std::size_t resumed = 0;
    std::size_t empty = 0;
    std::size_t failed = 0;
    std::size_t overlaps = 0;
    std::size_t lateStarts = 0;
    std::size_t stretchFailures = 0;
    std::size_t synthesisAttempts = 0;

    double targetSeconds = 0.0;
    double achievedSeconds = 0.0;
    double matchAccuracy = 0.0;

    // Cues that went through synthesis, cache or resume (everything but blank ones).
    std::size_t processed() const {
        return generated + cached + resumed + failed;
    }
};

// 1 - |achieved - target| / target. 1.0 when both are zero, 0.0 when only the target is.
double matchAccuracy(double achievedSeconds, double targetSeconds);

// Thread-safe event sink for a run. It never influences the pipeline.
class StatsCollector {
   public:
    StatsCollector() = default;
    StatsCollector(const StatsCollector&) = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    void setTotal(std::size_t total);

    void recordGenerated();
    void recordCached();
    void recordResumed();
    void recordEmpty();
    void recordFailed();
    void recordSynthesisAttempt();

    void recordOverlap();
    void recordLateStart();
    void recordStretchFailure();
    // Overlap, late start and stretch failure flags of one fitted cue.
    void recordSlot(const fitting::SlotResult& slot);

    void setDurations(double targetSeconds, double achievedSeconds);

    RunStats snapshot() const;
    nlohmann::json toJson() const;
    void logSummary() const;

    void reset();

   private:
    std::atomic<std::size_t> total_{0};
    std::atomic<std::size_t> generated_{0};
    std::atomic<std::size_t> cached_{0};
    std::atomic<std::size_t> resumed_{0};
    std::atomic<std::size_t> empty_{0};
    std::atomic<std::size_t> failed_{0};
    std::atomic<std::size_t> overlaps_{0};
    std::atomic<std::size_t> lateStarts_{0};
    std::atomic<std::size_t> stretchFailures_{0};
    std::atomic<std::size_t> synthesisAttempts_{0};
    std::atomic<double> targetSeconds_{0.0};
    std::atomic<double> achievedSeconds_{0.0};
};

nlohmann::json runStatsToJson(const RunStats& stats);

// Writes `<path>.tmp` then renames it over `path`.
bool writeStatsFile(const std::string& path, const RunStats& stats);

}  // namespace metrics
}  // namespace subdub
