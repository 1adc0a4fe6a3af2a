#include "metrics/stats_collector.h"

#include "logging/logger.h"

#include <cmath>
#include <cstdio>
#include <fstream>

namespace subdub {
namespace metrics {

double matchAccuracy(double achievedSeconds, double targetSeconds) {
    if (targetSeconds == 0.0) {
        return achievedSeconds == 0.0 ? 1.0 : 0.0;
    }
    return 1.0 - std::fabs(achievedSeconds - targetSeconds) / targetSeconds;
}

void StatsCollector::setTotal(std::size_t total) {
    total_.store(total, std::memory_order_relaxed);
}

void StatsCollector::recordGenerated() {
    generated_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::recordCached() {
    cached_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::recordResumed() {
    resumed_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::recordEmpty() {
    empty_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::recordFailed() {
    failed_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::recordSynthesisAttempt() {
    synthesisAttempts_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::recordOverlap() {
    overlaps_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::recordLateStart() {
    lateStarts_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::recordStretchFailure() {
    stretchFailures_.fetch_add(1, std::memory_order_relaxed);
}

void StatsCollector::recordSlot(const fitting::SlotResult& slot) {
    if (slot.overlapDetected) {
        recordOverlap();
    }
    if (slot.lateStart) {
        recordLateStart();
    }
    if (slot.stretchFailed) {
        recordStretchFailure();
    }
}

void StatsCollector::setDurations(double targetSeconds, double achievedSeconds) {
    targetSeconds_.store(targetSeconds, std::memory_order_relaxed);
    achievedSeconds_.store(achievedSeconds, std::memory_order_relaxed);
}

RunStats StatsCollector::snapshot() const {
    RunStats stats;
    stats.total = total_.load(std::memory_order_relaxed);
    stats.generated = generated_.load(std::memory_order_relaxed);
    stats.cached = cached_.load(std::memory_order_relaxed);
    stats.resumed = resumed_.load(std::memory_order_relaxed);
    stats.empty = empty_.load(std::memory_order_relaxed);
    stats.failed = failed_.load(std::memory_order_relaxed);
    stats.overlaps = overlaps_.load(std::memory_order_relaxed);
    stats.lateStarts = lateStarts_.load(std::memory_order_relaxed);
    stats.stretchFailures = stretchFailures_.load(std::memory_order_relaxed);
    stats.synthesisAttempts = synthesisAttempts_.load(std::memory_order_relaxed);
    stats.targetSeconds = targetSeconds_.load(std::memory_order_relaxed);
    stats.achievedSeconds = achievedSeconds_.load(std::memory_order_relaxed);
    stats.matchAccuracy = matchAccuracy(stats.achievedSeconds, stats.targetSeconds);
    return stats;
}

nlohmann::json runStatsToJson(const RunStats& stats) {
    nlohmann::json j;
    j["total"] = stats.total;
    j["generated"] = stats.generated;
    j["cached"] = stats.cached;
    j["resumed"] = stats.resumed;
    j["empty"] = stats.empty;
    j["failed"] = stats.failed;
    j["overlaps"] = stats.overlaps;
    j["late_starts"] = stats.lateStarts;
    j["stretch_failures"] = stats.stretchFailures;
    j["synthesis_attempts"] = stats.synthesisAttempts;

    nlohmann::json duration;
    duration["target_seconds"] = stats.targetSeconds;
    duration["achieved_seconds"] = stats.achievedSeconds;
    duration["match_accuracy"] = stats.matchAccuracy;
    j["duration"] = duration;
    return j;
}

nlohmann::json StatsCollector::toJson() const {
    return runStatsToJson(snapshot());
}

void StatsCollector::logSummary() const {
    RunStats s = snapshot();
    LOG_INFO("Run summary: {} cues ({} generated, {} cached, {} resumed, {} empty, {} failed)",
             s.total, s.generated, s.cached, s.resumed, s.empty, s.failed);
    LOG_INFO("  Synthesis attempts: {}", s.synthesisAttempts);
    LOG_INFO("  Overlaps: {}, late starts: {}, stretch failures: {}", s.overlaps, s.lateStarts,
             s.stretchFailures);
    LOG_INFO("  Duration: target {:.3f}s, achieved {:.3f}s, match {:.2f}%", s.targetSeconds,
             s.achievedSeconds, s.matchAccuracy * 100.0);
    LOG_IF(WARN, s.failed > 0, "{} cue(s) were replaced by silence", s.failed);
}

void StatsCollector::reset() {
    total_.store(0, std::memory_order_relaxed);
    generated_.store(0, std::memory_order_relaxed);
    cached_.store(0, std::memory_order_relaxed);
    resumed_.store(0, std::memory_order_relaxed);
    empty_.store(0, std::memory_order_relaxed);
    failed_.store(0, std::memory_order_relaxed);
    overlaps_.store(0, std::memory_order_relaxed);
    lateStarts_.store(0, std::memory_order_relaxed);
    stretchFailures_.store(0, std::memory_order_relaxed);
    synthesisAttempts_.store(0, std::memory_order_relaxed);
    targetSeconds_.store(0.0, std::memory_order_relaxed);
    achievedSeconds_.store(0.0, std::memory_order_relaxed);
}

bool writeStatsFile(const std::string& path, const RunStats& stats) {
    if (path.empty()) {
        return false;
    }

    std::string tmpPath = path + ".tmp";
    std::ofstream ofs(tmpPath);
    if (!ofs) {
        LOG_ERROR("Cannot open stats file for writing: {}", tmpPath);
        return false;
    }
    ofs << runStatsToJson(stats).dump(2) << '\n';
    ofs.close();
    if (!ofs || std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        LOG_ERROR("Failed to write stats file: {}", path);
        return false;
    }
    return true;
}

}  // namespace metrics
}  // namespace subdub
