/**
 * @file main.cpp
 * @brief task_planner command-line entry point.
 *
 * Wires the modules into one read pipeline:
 *   Config → Logger → Snapshot → Engine (load → readiness → score) → View
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/next_action_engine.hpp"
#include "engine/task_views.hpp"
#include "host/in_memory_store.hpp"
#include "host/snapshot_loader.hpp"
#include "schema/task_properties.hpp"
#include "schema/task_schema.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace task_planner;

namespace {

struct CLIArgs {
    std::filesystem::path snapshot_path;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> now;
    std::string view = "next";
    std::optional<std::string> log_level;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: task_planner [OPTIONS]\n"
              << "  --snapshot <file>    Outline snapshot (TOML)\n"
              << "  --config <path>      Configuration file\n"
              << "  --now <ISO8601>      Evaluation instant (default: current time)\n"
              << "  --view <name>        next | all | due-soon | starred | waiting (default: next)\n"
              << "  --log-level <lvl>    debug | info | warn | error\n"
              << "  --demo               Evaluate a built-in outline, then exit\n"
              << "  --help, -h           Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--snapshot" && i + 1 < argc) {
            args.snapshot_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--now" && i + 1 < argc) {
            args.now = argv[++i];
        } else if (arg == "--view" && i + 1 < argc) {
            args.view = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    return args;
}

std::string format_time(const std::optional<Timestamp>& t) {
    if (!t) return "-";
    auto tt = std::chrono::system_clock::to_time_t(*t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return oss.str();
}

void print_header() {
    std::cout << std::left
              << std::setw(8) << "ID" << std::setw(10) << "SCORE"
              << std::setw(10) << "STATUS" << std::setw(28) << "REASON"
              << std::setw(18) << "DUE" << "TEXT\n";
}

void print_row(const NextActionEvaluation& eval) {
    auto reason = eval.primary_reason();
    std::cout << std::left
              << std::setw(8) << eval.task_id
              << std::setw(10) << std::fixed << std::setprecision(3) << eval.score
              << std::setw(10) << to_string(eval.status)
              << std::setw(28) << (reason ? std::string{to_string(*reason)} : std::string{"ready"})
              << std::setw(18) << format_time(eval.end_time)
              << eval.text << "\n";
}

/**
 * @brief Evaluate once and print the requested view.
 */
int print_view(NextActionEngine& engine, const Config& config, const std::string& view) {
    auto evaluations = engine.collect_next_action_evaluations();
    if (!evaluations) {
        std::cerr << "Evaluation failed: " << evaluations.error().message << std::endl;
        return 1;
    }
    const auto& set = **evaluations;

    std::vector<NextActionEvaluation> rows;
    if (view == "next") {
        auto actions = engine.collect_next_actions();
        if (!actions) {
            std::cerr << "Evaluation failed: " << actions.error().message << std::endl;
            return 1;
        }
        for (const auto& item : *actions) {
            if (const auto* eval = set.find(item.task.id)) rows.push_back(*eval);
        }
    } else if (view == "all") {
        for (auto id : set.graph.containment_order()) {
            if (const auto* eval = set.find(id)) rows.push_back(*eval);
        }
    } else if (view == "due-soon") {
        rows = due_soon(set, set.evaluated_at, static_cast<int>(config.views.due_soon_days),
                        config.views.due_soon_include_overdue);
    } else if (view == "starred") {
        rows = starred_tasks(set);
    } else if (view == "waiting") {
        rows = waiting_tasks(set);
    } else {
        std::cerr << "Unknown view: " << view << std::endl;
        return 2;
    }

    print_header();
    for (const auto& row : rows) print_row(row);
    std::cout << rows.size() << " of " << set.evaluations.size() << " tasks\n";
    return 0;
}

Block demo_task(BlockId id, std::string text, std::optional<BlockId> parent,
                const TaskSchema& schema, TaskPropertyValues values) {
    Block block;
    block.id = id;
    block.text = std::move(text) + " #" + schema.tag_alias;
    block.parent = parent;
    BlockRef tag;
    tag.id = 1000 + id;
    tag.type = RefType::Tag;
    tag.alias = schema.tag_alias;
    tag.data = encode_task_properties(values, schema);
    block.refs.push_back(std::move(tag));
    return block;
}

/**
 * @brief Build a small outline, evaluate it, complete one task and
 *        evaluate again.
 */
int run_demo(const Config& config, const TaskSchema& schema, Logger& logger,
             MetricsCollector& metrics) {
    logger.info("=== Demo Mode ===");

    auto now = std::chrono::system_clock::now();
    InMemoryBlockStore store([&] { return now; });

    Block root;
    root.id = 1;
    root.text = "Release 2.0";
    store.add_block(root);

    auto values = default_task_values(schema);
    auto draft = values;
    draft.importance = 80;
    draft.end_time = now + std::chrono::hours(48);
    store.add_block(demo_task(2, "Draft release notes", 1, schema, draft));

    auto review = values;
    review.depends_on = {2};
    review.urgency = 70;
    store.add_block(demo_task(3, "Review release notes", 1, schema, review));

    auto publish = values;
    publish.depends_on = {3};
    publish.star = true;
    store.add_block(demo_task(4, "Publish", 1, schema, publish));
    store.add_block(demo_task(5, "Upload artifacts", 4, schema, values));

    auto waiting = values;
    waiting.status = TaskStatus::Waiting;
    store.add_block(demo_task(6, "Legal sign-off", 1, schema, waiting));

    NextActionEngineOptions options;
    options.waiting_multiplier = config.engine.waiting_multiplier;
    options.cache_enabled = config.engine.cache_enabled;
    options.clock = [&] { return now; };
    NextActionEngine engine(store, schema, logger, options, &metrics);

    std::cout << "\n-- before --\n";
    if (int rc = print_view(engine, config, "all"); rc != 0) return rc;

    if (auto done = engine.set_status(2, TaskStatus::Done); !done) {
        std::cerr << "set_status failed: " << done.error().message << std::endl;
        return 1;
    }

    std::cout << "\n-- after completing task 2 --\n";
    int rc = print_view(engine, config, "all");
    logger.info("=== Demo Complete ===");
    return rc;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return 2;
    }
    auto args = *parsed;

    // Load configuration
    Config config = default_config();
    if (args.config_path) {
        auto config_result = load_config(*args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        config = *config_result;
    }
    if (args.log_level) config.logging.level = *args.log_level;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.logging.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.logging.log_dir, "task_planner",
                                                  config.logging.max_file_size_mb,
                                                  config.logging.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.logging.level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.logging.level << std::endl;
        return 2;
    }
    Logger logger(std::move(log_sink), *level);
    MetricsCollector metrics(std::make_unique<NullSink>());

    auto schema = TaskSchema::from_config(config.schema);
    logger.debug("Task tag: #" + schema.tag_alias + ", locale " + schema.locale);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        return run_demo(config, schema, logger, metrics);
    }

    if (args.snapshot_path.empty()) {
        std::cerr << "--snapshot is required (or use --demo)" << std::endl;
        print_usage();
        return 2;
    }

    std::optional<Timestamp> now;
    if (args.now) {
        auto parsed_now = parse_timestamp(*args.now);
        if (!parsed_now) {
            std::cerr << parsed_now.error().message << std::endl;
            return 2;
        }
        now = *parsed_now;
    }
    auto clock = [now] { return now.value_or(std::chrono::system_clock::now()); };

    // ── Load snapshot ────────────────────────
    InMemoryBlockStore store(clock);
    auto loaded = load_snapshot(args.snapshot_path, store);
    if (!loaded) {
        std::cerr << "Failed to load snapshot: " << loaded.error().message << std::endl;
        return 1;
    }
    logger.info("Loaded " + std::to_string(*loaded) + " blocks from "
                + args.snapshot_path.string());

    NextActionEngineOptions options;
    options.waiting_multiplier = config.engine.waiting_multiplier;
    options.cache_enabled = config.engine.cache_enabled;
    options.clock = clock;
    NextActionEngine engine(store, schema, logger, options, &metrics);

    int rc = print_view(engine, config, args.view);
    logger.flush();
    metrics.flush();
    return rc;
}
