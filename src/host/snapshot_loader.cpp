/**
 * @file snapshot_loader.cpp
 * @brief TOML snapshot loading using toml++.
 */

#include "host/snapshot_loader.hpp"

#include <chrono>
#include <unordered_set>

#include <toml++/toml.hpp>

namespace task_planner {

namespace {

Timestamp to_timestamp(const toml::date& date, const toml::time& time, int offset_minutes) {
    using namespace std::chrono;
    sys_days day{year{date.year} / month{date.month} / std::chrono::day{date.day}};
    auto instant = time_point_cast<Timestamp::duration>(day)
        + hours{time.hour} + minutes{time.minute} + seconds{time.second}
        + duration_cast<Timestamp::duration>(nanoseconds{time.nanosecond})
        - minutes{offset_minutes};
    return instant;
}

Timestamp to_timestamp(const toml::date_time& dt) {
    int offset = dt.offset ? dt.offset->minutes : 0;
    return to_timestamp(dt.date, dt.time, offset);
}

std::optional<PropertyValue> array_value(const toml::array& arr, PropertyType& type) {
    if (arr.empty()) {
        type = PropertyType::BlockRefs;
        return PropertyValue{std::vector<BlockId>{}};
    }
    if (arr.is_homogeneous(toml::node_type::integer)) {
        std::vector<BlockId> ids;
        for (const auto& item : arr) ids.push_back(item.value<int64_t>().value_or(0));
        type = PropertyType::BlockRefs;
        return PropertyValue{std::move(ids)};
    }
    if (arr.is_homogeneous(toml::node_type::string)) {
        std::vector<std::string> strings;
        for (const auto& item : arr) strings.push_back(item.value<std::string>().value_or(""));
        type = PropertyType::TextChoices;
        return PropertyValue{std::move(strings)};
    }
    return std::nullopt;
}

Result<BlockProperty> to_property(std::string_view name, const toml::node& node) {
    BlockProperty prop;
    prop.name = std::string{name};

    if (auto s = node.value_exact<std::string>()) {
        prop.type = PropertyType::Text;
        prop.value = *s;
    } else if (auto b = node.value_exact<bool>()) {
        prop.type = PropertyType::Boolean;
        prop.value = *b;
    } else if (auto i = node.value_exact<int64_t>()) {
        prop.type = PropertyType::Number;
        prop.value = static_cast<double>(*i);
    } else if (auto d = node.value_exact<double>()) {
        prop.type = PropertyType::Number;
        prop.value = *d;
    } else if (auto dt = node.value_exact<toml::date_time>()) {
        prop.type = PropertyType::DateTime;
        prop.value = to_timestamp(*dt);
    } else if (auto date = node.value_exact<toml::date>()) {
        prop.type = PropertyType::DateTime;
        prop.value = to_timestamp(*date, toml::time{}, 0);
    } else if (const auto* arr = node.as_array()) {
        auto value = array_value(*arr, prop.type);
        if (!value) {
            return Error{ErrorCode::Parse, "property '" + prop.name + "' mixes value types"};
        }
        prop.value = std::move(*value);
    } else {
        return Error{ErrorCode::Parse, "property '" + prop.name + "' has an unsupported type"};
    }
    return prop;
}

std::optional<Timestamp> optional_time(const toml::node_view<const toml::node>& node) {
    if (auto dt = node.value_exact<toml::date_time>()) return to_timestamp(*dt);
    if (auto date = node.value_exact<toml::date>()) return to_timestamp(*date, toml::time{}, 0);
    return std::nullopt;
}

Result<Block> to_block(const toml::table& tbl, size_t index) {
    auto id = tbl["id"].value<int64_t>();
    if (!id) {
        return Error{ErrorCode::Parse, "block #" + std::to_string(index) + " has no integer id"};
    }

    Block block;
    block.id = *id;
    block.text = tbl["text"].value_or(std::string{});
    if (auto parent = tbl["parent"].value<int64_t>()) block.parent = *parent;
    if (auto mirror = tbl["mirror_of"].value<int64_t>()) block.mirror_of = *mirror;
    block.modified_at = optional_time(tbl["modified_at"]);

    if (const auto* tags = tbl["tag"].as_array()) {
        for (const auto& node : *tags) {
            const auto* tag = node.as_table();
            if (tag == nullptr) continue;

            BlockRef ref;
            ref.type = RefType::Tag;
            ref.alias = (*tag)["alias"].value_or(std::string{});
            ref.id = (*tag)["id"].value_or(int64_t{0});
            ref.to = (*tag)["to"].value_or(int64_t{0});
            if (ref.alias.empty()) {
                return Error{ErrorCode::Parse,
                             "tag on block " + std::to_string(block.id) + " has no alias"};
            }
            if (const auto* props = (*tag)["properties"].as_table()) {
                for (const auto& [key, value] : *props) {
                    auto prop = to_property(key.str(), value);
                    if (!prop) {
                        return Error{ErrorCode::Parse, "block " + std::to_string(block.id)
                                                           + ": " + prop.error().message};
                    }
                    ref.data.push_back(std::move(*prop));
                }
            }
            block.refs.push_back(std::move(ref));
        }
    }

    if (const auto* links = tbl["link"].as_array()) {
        for (const auto& node : *links) {
            const auto* link = node.as_table();
            if (link == nullptr) continue;
            auto to = (*link)["to"].value<int64_t>();
            if (!to) {
                return Error{ErrorCode::Parse,
                             "link on block " + std::to_string(block.id) + " has no target"};
            }
            BlockRef ref;
            ref.type = RefType::Link;
            ref.id = (*link)["id"].value_or(int64_t{0});
            ref.to = *to;
            block.refs.push_back(std::move(ref));
        }
    }
    return block;
}

Result<size_t> from_table(const toml::table& tbl, InMemoryBlockStore& store) {
    std::vector<Block> pending;
    if (const auto* blocks = tbl["block"].as_array()) {
        size_t index = 0;
        for (const auto& node : *blocks) {
            const auto* entry = node.as_table();
            if (entry == nullptr) {
                return Error{ErrorCode::Parse, "block #" + std::to_string(index) + " is not a table"};
            }
            auto block = to_block(*entry, index++);
            if (!block) {
                return block.error();
            }
            pending.push_back(std::move(*block));
        }
    }

    // The store links a child to its parent on insertion, so parents go first.
    std::unordered_set<BlockId> in_file;
    for (const auto& block : pending) in_file.insert(block.id);

    std::unordered_set<BlockId> added;
    size_t count = pending.size();
    while (!pending.empty()) {
        std::vector<Block> deferred;
        for (auto& block : pending) {
            bool ready = !block.parent || !in_file.contains(*block.parent)
                      || added.contains(*block.parent);
            if (ready) {
                added.insert(block.id);
                store.add_block(std::move(block));
            } else {
                deferred.push_back(std::move(block));
            }
        }
        if (deferred.size() == pending.size()) {
            // Parent loop in the file: insert the rest as they are.
            for (auto& block : deferred) store.add_block(std::move(block));
            break;
        }
        pending = std::move(deferred);
    }
    return count;
}

}  // namespace

Result<size_t> load_snapshot(const std::filesystem::path& path, InMemoryBlockStore& store) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "Snapshot file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl, store);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<size_t> parse_snapshot(std::string_view toml_text, InMemoryBlockStore& store) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl, store);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Timestamp> parse_timestamp(std::string_view text) {
    try {
        std::string doc = "t = " + std::string{text};
        const toml::table tbl = toml::parse(doc);
        if (auto t = optional_time(tbl["t"])) {
            return *t;
        }
    } catch (const toml::parse_error&) {
        // Falls through to the error below.
    }
    return Error{ErrorCode::Parse, "not an ISO 8601 date-time: " + std::string{text}};
}

}  // namespace task_planner
