/**
 * @file test_pool.cpp
 * @brief Unit tests for the generational object pool
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/Pool.hpp"

#include "utils/TestHelpers.hpp"

#include <set>
#include <string>
#include <vector>

using namespace Vigilant;
using namespace Vigilant::Test;

// =============================================================================
// Test Object Types
// =============================================================================

struct SimpleObject {
    int id = 0;
    float value = 0.0f;

    SimpleObject() = default;
    SimpleObject(int i, float v) : id(i), value(v) {}
};

// =============================================================================
// SlotHandle Tests
// =============================================================================

TEST(SlotHandleTest, DefaultIsInvalid) {
    SlotHandle handle;

    EXPECT_FALSE(handle.IsValid());
    EXPECT_EQ(SlotHandle::INVALID_INDEX, handle.index);
}

TEST(SlotHandleTest, PackPutsGenerationInHighBits) {
    SlotHandle handle{7, 3};

    EXPECT_EQ((uint64_t{3} << 32) | 7u, handle.Pack());
}

TEST(SlotHandleTest, UnpackRestoresHandle) {
    SlotHandle handle{123456, 42};

    EXPECT_EQ(handle, SlotHandle::Unpack(handle.Pack()));
}

// =============================================================================
// GenerationalPool Tests
// =============================================================================

class GenerationalPoolTest : public ::testing::Test {
protected:
    using TestPool = GenerationalPool<SimpleObject>;
};

TEST_F(GenerationalPoolTest, Construction) {
    TestPool pool;

    EXPECT_EQ(0u, pool.GetActiveCount());
    EXPECT_EQ(0u, pool.GetSlotCount());
}

TEST_F(GenerationalPoolTest, AllocateSingle) {
    TestPool pool;

    SlotHandle handle = pool.Allocate(42, 3.14f);

    ASSERT_TRUE(handle.IsValid());
    SimpleObject* obj = pool.Get(handle);
    ASSERT_NE(nullptr, obj);
    EXPECT_EQ(42, obj->id);
    EXPECT_FLOAT_EQ(3.14f, obj->value);
    EXPECT_EQ(1u, pool.GetActiveCount());
}

TEST_F(GenerationalPoolTest, PackedHandleIsNeverZero) {
    TestPool pool;

    for (int i = 0; i < 4; ++i) {
        SlotHandle handle = pool.Allocate();
        EXPECT_NE(0u, handle.Pack());
        pool.Deallocate(handle);
    }
}

TEST_F(GenerationalPoolTest, AllocateMultiple) {
    TestPool pool;
    std::vector<SlotHandle> handles;

    for (int i = 0; i < 10; ++i) {
        handles.push_back(pool.Allocate(i, static_cast<float>(i)));
    }

    EXPECT_EQ(10u, pool.GetActiveCount());
    for (int i = 0; i < 10; ++i) {
        ASSERT_NE(nullptr, pool.Get(handles[i]));
        EXPECT_EQ(i, pool.Get(handles[i])->id);
    }
}

TEST_F(GenerationalPoolTest, Deallocate) {
    TestPool pool;

    SlotHandle h1 = pool.Allocate(1, 1.0f);
    SlotHandle h2 = pool.Allocate(2, 2.0f);

    EXPECT_TRUE(pool.Deallocate(h1));

    EXPECT_EQ(1u, pool.GetActiveCount());
    EXPECT_EQ(nullptr, pool.Get(h1));
    EXPECT_FALSE(pool.IsActive(h1));
    EXPECT_TRUE(pool.IsActive(h2));
}

TEST_F(GenerationalPoolTest, DoubleDeallocateFails) {
    TestPool pool;
    SlotHandle handle = pool.Allocate();

    EXPECT_TRUE(pool.Deallocate(handle));
    EXPECT_FALSE(pool.Deallocate(handle));
    EXPECT_EQ(0u, pool.GetActiveCount());
}

TEST_F(GenerationalPoolTest, ReusedSlotRejectsStaleHandle) {
    TestPool pool;

    SlotHandle old = pool.Allocate(1, 0.0f);
    pool.Deallocate(old);
    SlotHandle reused = pool.Allocate(2, 0.0f);

    EXPECT_EQ(old.index, reused.index);
    EXPECT_NE(old.generation, reused.generation);
    EXPECT_NE(old.Pack(), reused.Pack());
    EXPECT_EQ(nullptr, pool.Get(old));
    ASSERT_NE(nullptr, pool.Get(reused));
    EXPECT_EQ(2, pool.Get(reused)->id);
    EXPECT_EQ(1u, pool.GetSlotCount());
}

TEST_F(GenerationalPoolTest, OutOfRangeHandleIsInactive) {
    TestPool pool;
    SlotHandle handle = pool.Allocate();

    EXPECT_FALSE(pool.IsActive(SlotHandle{handle.index + 5, handle.generation}));
    EXPECT_FALSE(pool.IsActive(SlotHandle{}));
}

TEST_F(GenerationalPoolTest, ForEachVisitsOnlyLiveObjects) {
    TestPool pool;
    std::vector<SlotHandle> handles;
    for (int i = 0; i < 6; ++i) {
        handles.push_back(pool.Allocate(i, 0.0f));
    }
    pool.Deallocate(handles[1]);
    pool.Deallocate(handles[4]);

    std::set<int> visited;
    pool.ForEach([&](SimpleObject& obj, SlotHandle handle) {
        EXPECT_TRUE(pool.IsActive(handle));
        visited.insert(obj.id);
    });

    EXPECT_EQ((std::set<int>{0, 2, 3, 5}), visited);
}

TEST_F(GenerationalPoolTest, ClearInvalidatesEverything) {
    TestPool pool;
    SlotHandle a = pool.Allocate();
    SlotHandle b = pool.Allocate();

    pool.Clear();

    EXPECT_EQ(0u, pool.GetActiveCount());
    EXPECT_FALSE(pool.IsActive(a));
    EXPECT_FALSE(pool.IsActive(b));

    // Slots are recycled after a clear
    SlotHandle c = pool.Allocate();
    EXPECT_EQ(2u, pool.GetSlotCount());
    EXPECT_TRUE(pool.IsActive(c));
}

TEST_F(GenerationalPoolTest, NonTrivialType) {
    GenerationalPool<std::string> pool;

    SlotHandle handle = pool.Allocate("ship");
    ASSERT_NE(nullptr, pool.Get(handle));
    EXPECT_EQ("ship", *pool.Get(handle));

    pool.Deallocate(handle);
    EXPECT_EQ(nullptr, pool.Get(handle));
}
