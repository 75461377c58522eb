/**
 * @file test_task_properties.cpp
 * @brief Unit tests for tolerant property decoding and label parsing.
 */

#include "schema/task_properties.hpp"

#include "../test_support.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace task_planner;
using namespace task_planner::test;

namespace {

BlockProperty prop(std::string name, PropertyValue value,
                   PropertyType type = PropertyType::Text) {
    return BlockProperty{std::move(name), type, std::move(value)};
}

}  // namespace

class TaskPropertiesTest : public ::testing::Test {
protected:
    TaskSchema schema_ = TaskSchema::for_locale("en");
};

TEST_F(TaskPropertiesTest, NullPayloadDecodesToDefaults) {
    auto values = decode_task_properties(nullptr, schema_);
    EXPECT_EQ(values.status_label, "TODO");
    EXPECT_EQ(values.status, TaskStatus::Todo);
    EXPECT_FALSE(values.start_time.has_value());
    EXPECT_FALSE(values.importance.has_value());
    EXPECT_FALSE(values.star);
    EXPECT_TRUE(values.depends_on.empty());
    EXPECT_EQ(values.depends_mode, DependencyMode::All);
    EXPECT_FALSE(values.dependency_delay_hours.has_value());
}

TEST_F(TaskPropertiesTest, DecodesTypedValues) {
    Timestamp start{std::chrono::seconds{1'700'000'000}};
    std::vector<BlockProperty> data{
        prop("Status", std::string{"Doing"}, PropertyType::TextChoices),
        prop("Start time", start, PropertyType::DateTime),
        prop("Importance", 80.0, PropertyType::Number),
        prop("Star", true, PropertyType::Boolean),
        prop("Depends on", std::vector<BlockId>{3, 4, 3}, PropertyType::BlockRefs),
        prop("Depends mode", std::string{"ANY"}, PropertyType::TextChoices),
        prop("Dependency delay", 24.0, PropertyType::Number),
        prop("Remark", std::string{"call first"}),
    };

    auto values = decode_task_properties(&data, schema_);
    EXPECT_EQ(values.status, TaskStatus::Doing);
    ASSERT_TRUE(values.start_time.has_value());
    EXPECT_EQ(*values.start_time, start);
    EXPECT_DOUBLE_EQ(*values.importance, 80.0);
    EXPECT_TRUE(values.star);
    EXPECT_EQ(values.depends_on, (std::vector<BlockId>{3, 4}));
    EXPECT_EQ(values.depends_mode, DependencyMode::Any);
    EXPECT_DOUBLE_EQ(*values.dependency_delay_hours, 24.0);
    EXPECT_EQ(values.remark, "call first");
}

TEST_F(TaskPropertiesTest, WrongTypesFallBack) {
    std::vector<BlockProperty> data{
        prop("Status", 42.0),
        prop("Start time", std::string{"tomorrow"}),
        prop("Importance", std::string{"high"}),
        prop("Star", std::string{"yes"}),
        prop("Depends on", true),
    };

    auto values = decode_task_properties(&data, schema_);
    EXPECT_EQ(values.status, TaskStatus::Todo);
    EXPECT_FALSE(values.start_time.has_value());
    EXPECT_FALSE(values.importance.has_value());
    EXPECT_FALSE(values.star);
    EXPECT_TRUE(values.depends_on.empty());
}

TEST_F(TaskPropertiesTest, ScoresAreClamped) {
    std::vector<BlockProperty> data{
        prop("Importance", 250.0, PropertyType::Number),
        prop("Urgency", -5.0, PropertyType::Number),
    };
    auto values = decode_task_properties(&data, schema_);
    EXPECT_DOUBLE_EQ(*values.importance, 100.0);
    EXPECT_DOUBLE_EQ(*values.urgency, 0.0);
}

TEST_F(TaskPropertiesTest, NegativeDelayIsDropped) {
    std::vector<BlockProperty> data{prop("Dependency delay", -3.0, PropertyType::Number)};
    auto values = decode_task_properties(&data, schema_);
    EXPECT_FALSE(values.dependency_delay_hours.has_value());
}

TEST_F(TaskPropertiesTest, EpochMillisecondsAreTimes) {
    std::vector<BlockProperty> data{prop("End time", 1'714'521'600'000.0, PropertyType::DateTime)};
    auto values = decode_task_properties(&data, schema_);
    ASSERT_TRUE(values.end_time.has_value());
    EXPECT_EQ(*values.end_time, Timestamp{std::chrono::seconds{1'714'521'600}});
}

TEST_F(TaskPropertiesTest, DependsOnAcceptsStringIds) {
    std::vector<BlockProperty> data{
        prop("Depends on", std::vector<std::string>{"7", "x", "8", "7"})};
    auto values = decode_task_properties(&data, schema_);
    EXPECT_EQ(values.depends_on, (std::vector<BlockId>{7, 8}));
}

TEST_F(TaskPropertiesTest, CanceledLabelDecodesToCanceled) {
    std::vector<BlockProperty> data{prop("Status", std::string{"Cancelled"})};
    auto values = decode_task_properties(&data, schema_);
    EXPECT_EQ(values.status, TaskStatus::Canceled);
    EXPECT_EQ(values.status_label, "Cancelled");
}

TEST_F(TaskPropertiesTest, EncodeThenDecodePreservesFields) {
    auto values = default_task_values(schema_);
    values.status = TaskStatus::Waiting;
    values.urgency = 65.0;
    values.depends_on = {11, 12};
    values.depends_mode = DependencyMode::Any;
    values.labels = {"home", "Home", "errand"};
    values.waiting_since = base_time();

    auto encoded = encode_task_properties(values, schema_);
    auto decoded = decode_task_properties(&encoded, schema_);
    EXPECT_EQ(decoded.status, TaskStatus::Waiting);
    EXPECT_EQ(decoded.status_label, "Waiting");
    EXPECT_DOUBLE_EQ(*decoded.urgency, 65.0);
    EXPECT_EQ(decoded.depends_on, (std::vector<BlockId>{11, 12}));
    EXPECT_EQ(decoded.depends_mode, DependencyMode::Any);
    EXPECT_EQ(decoded.labels, (std::vector<std::string>{"home", "errand"}));
    EXPECT_EQ(decoded.waiting_since, std::optional<Timestamp>{base_time()});
    EXPECT_FALSE(decoded.completed_at.has_value());
}

TEST(TaskLabelsTest, SplitsOnSeparators) {
    auto labels = parse_task_labels("home, work；deep  focus\nerrand;home");
    EXPECT_EQ(labels, (std::vector<std::string>{"home", "work", "deep focus", "errand"}));
}

TEST(TaskLabelsTest, JsonLookingArray) {
    auto labels = parse_task_labels(R"( ["a", "b c", "A"] )");
    EXPECT_EQ(labels, (std::vector<std::string>{"a", "b c"}));
}

TEST(TaskLabelsTest, BlankInput) {
    EXPECT_TRUE(parse_task_labels("   ").empty());
    EXPECT_TRUE(parse_task_labels(", ,").empty());
}
