/**
 * @file next_action_engine.cpp
 * @brief NextActionEngine implementation.
 */

#include "engine/next_action_engine.hpp"

#include "engine/readiness.hpp"
#include "engine/score_context.hpp"
#include "graph/identity_resolver.hpp"
#include "graph/task_loader.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <unordered_set>

namespace task_planner {

namespace {

bool valid_score(const std::optional<double>& value) {
    return !value || (std::isfinite(*value) && *value >= 0.0 && *value <= 100.0);
}

/// Status transition with its timestamps. Doing stamps the start time if
/// unset; entering done or waiting stamps the instant, leaving clears it.
void enter_status(TaskPropertyValues& values, TaskStatus status, Timestamp at,
                  const TaskSchema& schema) {
    if (status == TaskStatus::Doing && !values.start_time) {
        values.start_time = at;
    }
    if (status != TaskStatus::Done) {
        values.completed_at.reset();
    } else if (values.status != TaskStatus::Done || !values.completed_at) {
        values.completed_at = at;
    }
    if (status != TaskStatus::Waiting) {
        values.waiting_since.reset();
    } else if (values.status != TaskStatus::Waiting || !values.waiting_since) {
        values.waiting_since = at;
    }
    values.status = status;
    values.status_label = schema.label_for(status);
}

}  // namespace

NextActionEngine::NextActionEngine(IBlockStore& store,
                                   TaskSchema schema,
                                   Logger& logger,
                                   NextActionEngineOptions options,
                                   MetricsCollector* metrics)
    : store_(store),
      schema_(std::move(schema)),
      logger_(logger),
      options_(std::move(options)),
      metrics_(metrics) {}

Timestamp NextActionEngine::now() const {
    return options_.clock ? options_.clock() : std::chrono::system_clock::now();
}

// ─────────────────────────────────────────────
// Reads
// ─────────────────────────────────────────────

Result<EvaluationSetPtr> NextActionEngine::collect_next_action_evaluations() {
    if (options_.cache_enabled) {
        if (auto cached = cache_.get()) {
            logger_.debug("evaluation cache hit (generation "
                          + std::to_string(cached->generation) + ")");
            if (metrics_) metrics_->record_cache_hit(cached->generation);
            return cached;
        }
    }

    auto pass = run_pass();
    if (!pass) {
        logger_.warn("evaluation pass failed: " + pass.error().message);
        return pass.error();
    }
    if (options_.cache_enabled) {
        cache_.store(*pass);
    }
    return pass;
}

Result<EvaluationSetPtr> NextActionEngine::run_pass() {
    auto started = std::chrono::steady_clock::now();
    Timestamp at = now();
    uint64_t generation = cache_.generation();

    LoadStats stats;
    auto loaded = load_all_tasks(store_, schema_, &stats);
    if (!loaded) {
        return loaded.error();
    }

    auto set = std::make_shared<EvaluationSet>();
    set->generation = generation;
    set->evaluated_at = at;
    set->load_stats = stats;
    set->graph = std::move(loaded).value();
    const auto& graph = set->graph;
    set->dependency_cycle = graph.has_dependency_cycle();

    auto readiness = evaluate_readiness(graph, at);
    auto contexts = build_score_contexts(graph, at);

    set->evaluations.reserve(graph.task_count());
    for (const auto& task : graph.tasks()) {
        auto it = readiness.find(task.id);
        if (it == readiness.end()) continue;
        NextActionEvaluation eval = std::move(it->second);
        double multiplier = task.status == TaskStatus::Waiting ? options_.waiting_multiplier : 1.0;
        eval.score = score_task(task, at, contexts[task.id], multiplier);
        set->evaluations.push_back(std::move(eval));
    }
    std::sort(set->evaluations.begin(), set->evaluations.end(),
              [](const NextActionEvaluation& a, const NextActionEvaluation& b) {
                  return a.task_id < b.task_id;
              });
    set->build_index();

    auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);

    if (stats.dangling_dependencies > 0) {
        logger_.debug("dropped " + std::to_string(stats.dangling_dependencies)
                      + " dangling dependency reference(s)");
    }
    if (set->dependency_cycle) {
        logger_.debug("dependency cycle present; affected tasks stay dependency-unmet");
    }

    std::ostringstream msg;
    msg << "evaluation pass: " << graph.task_count() << " tasks, "
        << set->next_action_count() << " next actions, generation " << generation
        << ", " << elapsed.count() << "us";
    logger_.info(msg.str());

    if (metrics_) {
        EvaluationPassStats pass_stats;
        pass_stats.generation = generation;
        pass_stats.tasks = graph.task_count();
        pass_stats.next_actions = set->next_action_count();
        pass_stats.dangling_dependencies = stats.dangling_dependencies;
        pass_stats.dependency_cycle = set->dependency_cycle;
        pass_stats.duration = elapsed;
        metrics_->record_evaluation_pass(pass_stats);
    }

    return EvaluationSetPtr{std::move(set)};
}

Result<std::vector<NextActionItem>> NextActionEngine::collect_next_actions() {
    auto evaluations = collect_next_action_evaluations();
    if (!evaluations) {
        return evaluations.error();
    }
    const auto& set = **evaluations;

    std::vector<NextActionItem> items;
    for (const auto& eval : set.evaluations) {
        if (!eval.is_next_action) continue;
        const auto* task = set.graph.find(eval.task_id);
        if (task == nullptr) continue;
        items.push_back(NextActionItem{*task, eval.score});
    }
    std::sort(items.begin(), items.end(), [](const NextActionItem& a, const NextActionItem& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.task.id < b.task.id;
    });
    return items;
}

Result<std::vector<Task>> NextActionEngine::collect_all_tasks() {
    auto evaluations = collect_next_action_evaluations();
    if (!evaluations) {
        return evaluations.error();
    }
    const auto& graph = (*evaluations)->graph;

    std::vector<Task> tasks;
    tasks.reserve(graph.task_count());
    for (auto id : graph.containment_order()) {
        if (const auto* task = graph.find(id)) {
            tasks.push_back(*task);
        }
    }
    return tasks;
}

void NextActionEngine::invalidate_next_action_evaluation_cache(std::string_view reason) {
    cache_.invalidate();
    logger_.debug("evaluation cache invalidated: " + std::string(reason));
    if (metrics_) metrics_->record_cache_invalidated(cache_.generation(), reason);
}

// ─────────────────────────────────────────────
// Write path
// ─────────────────────────────────────────────

Result<TaskId> NextActionEngine::resolve_task(BlockId id) const {
    auto raw = store_.live_block(id);
    if (!raw) {
        return task_not_found(id);
    }

    const std::vector<Block> no_working_set;
    IdentityResolver resolver(store_, no_working_set);
    TaskId canonical = resolver.canonical_id(id);

    auto live = store_.live_block(canonical);
    bool tagged = (live && find_tag_ref(*live, schema_.tag_alias) != nullptr)
               || find_tag_ref(*raw, schema_.tag_alias) != nullptr;
    if (!live || !tagged) {
        return task_not_found(id);
    }
    return canonical;
}

TaskPropertyValues NextActionEngine::read_values(TaskId id) const {
    auto live = store_.live_block(id);
    const BlockRef* tag = live ? find_tag_ref(*live, schema_.tag_alias) : nullptr;
    return decode_task_properties(tag ? &tag->data : nullptr, schema_);
}

Result<void> NextActionEngine::apply_command(std::string_view command,
                                             BlockId id,
                                             const std::function<Result<void>(TaskId)>& action) {
    auto resolved = resolve_task(id);
    if (!resolved) {
        logger_.warn(std::string(command) + " failed: " + resolved.error().message);
        if (metrics_) metrics_->record_task_mutation(command, id, false);
        return resolved.error();
    }

    auto result = action(*resolved);
    // A failed command may still have written part of its change.
    invalidate_next_action_evaluation_cache(command);

    if (!result) {
        logger_.warn(std::string(command) + " failed on task " + std::to_string(*resolved)
                     + ": " + result.error().message);
    }
    if (metrics_) metrics_->record_task_mutation(command, *resolved, result.has_value());
    return result;
}

Result<void> NextActionEngine::update_task(std::string_view command,
                                           BlockId id,
                                           const Mutation& mutate) {
    return apply_command(command, id, [&](TaskId task) -> Result<void> {
        auto values = read_values(task);
        auto changed = mutate(task, values);
        if (!changed) {
            return changed;
        }
        return store_.set_ref_data(task, schema_.tag_alias, encode_task_properties(values, schema_));
    });
}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

Result<void> NextActionEngine::set_status(BlockId id, TaskStatus status) {
    return update_task("set_status", id, [&](TaskId, TaskPropertyValues& values) -> Result<void> {
        enter_status(values, status, now(), schema_);
        return {};
    });
}

Result<TaskStatus> NextActionEngine::cycle_status(BlockId id) {
    TaskStatus next = TaskStatus::Todo;
    auto result = update_task("cycle_status", id,
        [&](TaskId, TaskPropertyValues& values) -> Result<void> {
            next = next_status_in_main_cycle(values.status);
            enter_status(values, next, now(), schema_);
            return {};
        });
    if (!result) {
        return result.error();
    }
    return next;
}

Result<void> NextActionEngine::set_star(BlockId id, bool star) {
    return update_task("set_star", id, [&](TaskId, TaskPropertyValues& values) -> Result<void> {
        values.star = star;
        return {};
    });
}

Result<void> NextActionEngine::set_dependencies(BlockId id,
                                                const std::vector<BlockId>& depends_on,
                                                DependencyMode mode,
                                                std::optional<double> delay_hours) {
    return update_task("set_dependencies", id,
        [&](TaskId task, TaskPropertyValues& values) -> Result<void> {
            if (delay_hours && (!std::isfinite(*delay_hours) || *delay_hours < 0.0)) {
                return Error{ErrorCode::InvalidArgument, "dependency delay must be a non-negative number of hours"};
            }

            const std::vector<Block> no_working_set;
            IdentityResolver resolver(store_, no_working_set);
            std::vector<BlockId> targets;
            std::unordered_set<TaskId> seen;
            for (auto raw : depends_on) {
                TaskId target = resolver.canonical_id(raw);
                if (target == task) continue;
                if (seen.insert(target).second) {
                    targets.push_back(target);
                }
            }

            values.depends_on = std::move(targets);
            values.depends_mode = mode;
            values.dependency_delay_hours = delay_hours;
            return {};
        });
}

Result<void> NextActionEngine::set_schedule(BlockId id,
                                            std::optional<Timestamp> start_time,
                                            std::optional<Timestamp> end_time) {
    return update_task("set_schedule", id, [&](TaskId, TaskPropertyValues& values) -> Result<void> {
        if (start_time && end_time && *end_time < *start_time) {
            return Error{ErrorCode::InvalidArgument, "end time precedes start time"};
        }
        values.start_time = start_time;
        values.end_time = end_time;
        return {};
    });
}

Result<void> NextActionEngine::set_priority(BlockId id,
                                            std::optional<double> importance,
                                            std::optional<double> urgency,
                                            std::optional<double> effort) {
    return update_task("set_priority", id, [&](TaskId, TaskPropertyValues& values) -> Result<void> {
        if (!valid_score(importance) || !valid_score(urgency) || !valid_score(effort)) {
            return Error{ErrorCode::InvalidArgument, "priority values must lie in [0, 100]"};
        }
        values.importance = importance;
        values.urgency = urgency;
        values.effort = effort;
        return {};
    });
}

Result<BlockId> NextActionEngine::add_subtask(BlockId parent_id, std::string text) {
    BlockId created = 0;
    auto result = apply_command("add_subtask", parent_id, [&](TaskId parent) -> Result<void> {
        auto child = store_.insert_child_block(parent, std::move(text));
        if (!child) {
            return child.error();
        }
        created = *child;
        return store_.insert_tag(created, schema_.tag_alias,
                                 encode_task_properties(default_task_values(schema_), schema_));
    });
    if (!result) {
        return result.error();
    }
    return created;
}

Result<void> NextActionEngine::remove_task_tag(BlockId id) {
    return apply_command("remove_task_tag", id, [&](TaskId task) -> Result<void> {
        return store_.remove_tag(task, schema_.tag_alias);
    });
}

Result<void> NextActionEngine::move_task(BlockId id, std::optional<BlockId> new_parent) {
    return apply_command("move_task", id, [&](TaskId task) -> Result<void> {
        std::optional<BlockId> target;
        if (new_parent) {
            const std::vector<Block> no_working_set;
            IdentityResolver resolver(store_, no_working_set);
            target = resolver.canonical_id(*new_parent);
            if (!store_.live_block(*target)) {
                return Error{ErrorCode::NotFound, "block not found: " + std::to_string(*new_parent)};
            }
        }
        return store_.move_block(task, target);
    });
}

}  // namespace task_planner
