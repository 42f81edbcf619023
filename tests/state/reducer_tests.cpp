/**
 * @file reducer_tests.cpp
 * @brief Unit tests for the built-in channel reducers.
 */
#include <gtest/gtest.h>
#include "stepflow/state/reducer.hpp"

#include <algorithm>

using namespace stepflow;

// ============================================================================
// replace
// ============================================================================

TEST(ReducerTests, Replace_ReturnsUpdate)
{
    auto reduce = reducers::replace();
    EXPECT_EQ(reduce(1, 2), Value(2));
    EXPECT_EQ(reduce(nullptr, "x"), Value("x"));
    EXPECT_EQ(reduce(Value::array({1, 2}), nullptr), Value(nullptr));
}

// ============================================================================
// append
// ============================================================================

TEST(ReducerTests, Append_ConcatenatesArrays)
{
    auto reduce = reducers::append();
    EXPECT_EQ(reduce(Value::array({1, 2}), Value::array({3, 4})), Value::array({1, 2, 3, 4}));
}

TEST(ReducerTests, Append_PushesSingleValue)
{
    auto reduce = reducers::append();
    EXPECT_EQ(reduce(Value::array({"a"}), "b"), Value::array({"a", "b"}));
}

TEST(ReducerTests, Append_NullCurrent_StartsList)
{
    auto reduce = reducers::append();
    EXPECT_EQ(reduce(nullptr, Value::array({1})), Value::array({1}));
    EXPECT_EQ(reduce(nullptr, 7), Value::array({7}));
}

TEST(ReducerTests, Append_NonListCurrent_Throws)
{
    auto reduce = reducers::append();
    EXPECT_THROW(reduce(Value{{"k", 1}}, 2), std::invalid_argument);
}

TEST(ReducerTests, Append_PreservesUpdateOrder)
{
    auto reduce = reducers::append();
    Value state = Value::array();
    state = reduce(state, Value::array({"w0"}));
    state = reduce(state, Value::array({"w1"}));
    state = reduce(state, Value::array({"w2"}));
    EXPECT_EQ(state, Value::array({"w0", "w1", "w2"}));
}

// ============================================================================
// upsert_by_id
// ============================================================================

TEST(ReducerTests, Upsert_ReplacesMatchingIds)
{
    auto reduce = reducers::upsert_by_id();
    Value current = Value::array({Value{{"id", "a"}, {"v", 1}}, Value{{"id", "b"}, {"v", 1}}});
    Value merged = reduce(current, Value::array({Value{{"id", "b"}, {"v", 2}}}));

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0], (Value{{"id", "a"}, {"v", 1}}));
    EXPECT_EQ(merged[1], (Value{{"id", "b"}, {"v", 2}}));
}

TEST(ReducerTests, Upsert_CustomKeyAndSingleItem)
{
    auto reduce = reducers::upsert_by_id("key");
    Value merged = reduce(nullptr, Value{{"key", 5}, {"text", "five"}});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0]["text"], "five");
}

TEST(ReducerTests, Upsert_ItemWithoutId_Throws)
{
    auto reduce = reducers::upsert_by_id();
    EXPECT_THROW(reduce(Value::array(), Value::array({Value{{"name", "x"}}})), std::invalid_argument);
    EXPECT_THROW(reduce(Value::array(), Value::array({42})), std::invalid_argument);
    EXPECT_THROW(reduce(Value::array(), Value::array({Value{{"id", nullptr}}})), std::invalid_argument);
}

TEST(ReducerTests, Upsert_DisjointIds_OrderIndependent)
{
    auto reduce = reducers::upsert_by_id();
    std::vector<Value> updates = {
        Value::array({Value{{"id", "f1"}, {"sev", "high"}}}),
        Value::array({Value{{"id", "f2"}, {"sev", "low"}}, Value{{"id", "f3"}, {"sev", "mid"}}}),
        Value::array({Value{{"id", "f4"}, {"sev", "low"}}}),
        Value::array({Value{{"id", "f0"}, {"sev", "info"}}}),
    };

    std::vector<size_t> order = {0, 1, 2, 3};
    Value expected;
    bool first = true;
    do
    {
        Value state = Value::array();
        for (size_t idx : order)
        {
            state = reduce(state, updates[idx]);
        }
        if (first)
        {
            expected = state;
            first = false;
        }
        EXPECT_EQ(state, expected);
    } while (std::next_permutation(order.begin(), order.end()));

    EXPECT_EQ(expected.size(), 5u);
}
