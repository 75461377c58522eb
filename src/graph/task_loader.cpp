/**
 * @file task_loader.cpp
 * @brief Task graph loading: fetch, canonicalize, decode, link.
 */

#include "graph/task_loader.hpp"

#include "graph/identity_resolver.hpp"
#include "schema/task_properties.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace task_planner {

namespace {

constexpr const char* kUntitledTask = "(untitled task)";

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// Resolve one dependsOn entry. Ref ids on the source block win over raw
/// block ids, since hosts store dependsOn as references.
TaskId resolve_dependency(const Block& source_block,
                          BlockId entry,
                          const IdentityResolver& resolver) {
    for (const auto& ref : source_block.refs) {
        if (ref.type == RefType::Link && ref.id == entry) {
            return resolver.canonical_id(ref.to);
        }
    }
    return resolver.canonical_id(entry);
}

}  // namespace

std::string resolve_task_text(const Block& block, std::string_view /*tag_alias*/) {
    // Drop every `#tag` token; the task tag is one of them.
    std::string out;
    size_t i = 0;
    const auto& text = block.text;
    while (i < text.size()) {
        bool token_start = text[i] == '#' && (i == 0 || is_space(text[i - 1]));
        if (token_start) {
            while (i < text.size() && !is_space(text[i])) ++i;
            continue;
        }
        if (is_space(text[i])) {
            if (!out.empty() && out.back() != ' ') out += ' ';
            ++i;
            continue;
        }
        out += text[i++];
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out.empty() ? std::string{kUntitledTask} : out;
}

Result<TaskGraph> load_all_tasks(IBlockSource& source,
                                 const TaskSchema& schema,
                                 LoadStats* stats) {
    auto fetched = source.fetch_tagged_blocks(schema.tag_alias);
    if (!fetched) {
        return fetched.error();
    }

    const auto& blocks = *fetched;
    IdentityResolver resolver(source, blocks);
    LoadStats local_stats;
    local_stats.fetched_blocks = blocks.size();

    TaskGraph graph;
    std::unordered_map<TaskId, Block> block_by_task;

    // ── Pass 1: one Task per canonical id ─────
    for (const auto& record : blocks) {
        TaskId id = resolver.canonical_id(record.id);
        if (graph.contains(id)) {
            ++local_stats.merged_duplicates;
            continue;
        }

        // Live values win; the fetched record is the fallback.
        auto preferred = resolver.preferred_block(id).value_or(record);
        const auto* tag = find_tag_ref(preferred, schema.tag_alias);
        if (tag == nullptr) {
            tag = find_tag_ref(record, schema.tag_alias);
        }
        if (tag == nullptr) {
            continue;
        }

        auto values = decode_task_properties(&tag->data, schema);

        Task task;
        task.id = id;
        task.source_block_id = preferred.id;
        task.text = resolve_task_text(preferred, schema.tag_alias);
        task.status_label = std::move(values.status_label);
        task.status = values.status;
        task.start_time = values.start_time;
        task.end_time = values.end_time;
        task.importance = values.importance;
        task.urgency = values.urgency;
        task.effort = values.effort;
        task.star = values.star;
        task.labels = std::move(values.labels);
        task.remark = std::move(values.remark);
        task.depends_mode = values.depends_mode;
        task.dependency_delay_hours = values.dependency_delay_hours;
        task.modified_at = preferred.modified_at;
        task.completed_at = values.completed_at;
        task.waiting_since = values.waiting_since;

        std::unordered_set<TaskId> seen;
        for (auto entry : values.depends_on) {
            TaskId target = resolve_dependency(preferred, entry, resolver);
            if (target == id) {
                ++local_stats.self_dependencies;
                continue;
            }
            if (seen.insert(target).second) {
                task.depends_on.push_back(target);
            }
        }

        graph.add_task(std::move(task));
        block_by_task.emplace(id, std::move(preferred));
    }

    // ── Pass 2: containment between tasks ─────
    for (const auto& task : graph.tasks()) {
        const auto& block = block_by_task.at(task.id);
        for (auto child_block : block.children) {
            TaskId child = resolver.canonical_id(child_block);
            if (child == task.id || !graph.contains(child)) continue;
            const auto& child_record = block_by_task.at(child);
            // The child's own parent pointer is authoritative.
            if (child_record.parent && resolver.canonical_id(*child_record.parent) == task.id) {
                graph.set_parent(child, task.id);
            }
        }
    }
    for (const auto& [id, block] : block_by_task) {
        if (!block.parent) continue;
        TaskId parent = resolver.canonical_id(*block.parent);
        const auto* task = graph.find(id);
        if (parent != id && graph.contains(parent) && task && !task->parent) {
            graph.set_parent(id, parent);
        }
    }

    // ── Pass 3: dependency edges ──────────────
    std::vector<std::pair<TaskId, TaskId>> edges;
    for (const auto& task : graph.tasks()) {
        for (auto target : task.depends_on) {
            if (graph.contains(target)) {
                edges.emplace_back(task.id, target);
            } else {
                ++local_stats.dangling_dependencies;
            }
        }
    }
    for (const auto& [dependent, prerequisite] : edges) {
        graph.add_dependency(dependent, prerequisite);
    }

    local_stats.tasks = graph.task_count();
    if (stats != nullptr) {
        *stats = local_stats;
    }
    return graph;
}

}  // namespace task_planner
