/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace task_planner {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_evaluation_pass(const EvaluationPassStats& stats) {
    std::ostringstream oss;
    oss << R"({"event":"evaluation_pass")"
        << R"(,"generation":)" << stats.generation
        << R"(,"tasks":)" << stats.tasks
        << R"(,"next_actions":)" << stats.next_actions
        << R"(,"dangling_edges":)" << stats.dangling_dependencies
        << R"(,"dependency_cycle":)" << (stats.dependency_cycle ? "true" : "false")
        << R"(,"duration_us":)" << stats.duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_cache_hit(uint64_t generation) {
    std::ostringstream oss;
    oss << R"({"event":"cache_hit")"
        << R"(,"generation":)" << generation
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_cache_invalidated(uint64_t generation, std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"cache_invalidated")"
        << R"(,"generation":)" << generation
        << R"(,"reason":")" << json_escape(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_task_mutation(std::string_view command, TaskId id, bool ok) {
    std::ostringstream oss;
    oss << R"({"event":"task_mutation")"
        << R"(,"command":")" << json_escape(command) << "\""
        << R"(,"task":)" << id
        << R"(,"ok":)" << (ok ? "true" : "false")
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace task_planner
