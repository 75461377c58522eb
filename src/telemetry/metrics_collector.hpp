/**
 * @file metrics_collector.hpp
 * @brief Structured planner events as NDJSON.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace task_planner {

/**
 * @brief Summary of one evaluation pass.
 */
struct EvaluationPassStats {
    uint64_t generation = 0;
    size_t tasks = 0;
    size_t next_actions = 0;
    size_t dangling_dependencies = 0;
    bool dependency_cycle = false;
    Duration duration{0};
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_evaluation_pass(const EvaluationPassStats& stats);
    void record_cache_hit(uint64_t generation);
    void record_cache_invalidated(uint64_t generation, std::string_view reason);
    void record_task_mutation(std::string_view command, TaskId id, bool ok);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace task_planner
