#include <gtest/gtest.h>

#include "test_oracles.hpp"
#include <sheetpack/sheet_allocator.hpp>
#include <sheetpack/errors.hpp>
#include <algorithm>

using namespace sheetpack;

TEST(ItemPool, TakesExactOrientationBeforeSwapped) {
    item_pool pool({size(3, 4), size(4, 3), size(3, 4)});
    pool_item taken;

    ASSERT_TRUE(pool.take(size(4, 3), taken));
    EXPECT_EQ(taken.index, 1u);
    EXPECT_EQ(taken.item_size, size(4, 3));

    ASSERT_TRUE(pool.take(size(4, 3), taken));
    EXPECT_EQ(taken.index, 0u);

    EXPECT_FALSE(pool.take(size(5, 5), taken));
    ASSERT_EQ(pool.count(), 1u);
    EXPECT_EQ(pool.items()[0].index, 2u);
}

TEST(SheetAllocator, IdenticalSquaresFitOnOneSheet) {
    shelf_oracle oracle;

    auto result = allocate_sheets(size_list(5, size(2, 2)), size(10, 2), oracle);

    ASSERT_EQ(result.sheets.size(), 1u);
    EXPECT_EQ(result.sheets[0].packing.sizes.size(), 5u);
    EXPECT_TRUE(result.is_complete());
    EXPECT_EQ(result.reason, stop_reason::completed);
    EXPECT_EQ(result.placed_count(), 5u);
}

TEST(SheetAllocator, FillsSuccessiveSheets) {
    shelf_oracle oracle;

    auto result = allocate_sheets(size_list(5, size(2, 2)), size(4, 2), oracle);

    ASSERT_EQ(result.sheets.size(), 3u);
    EXPECT_EQ(result.sheets[0].item_indexes, (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(result.sheets[1].item_indexes, (std::vector<std::size_t>{2, 3}));
    EXPECT_EQ(result.sheets[2].item_indexes, (std::vector<std::size_t>{4}));
    for(auto const& s : result.sheets) {
        EXPECT_EQ(s.bounds, size(4, 2));
        EXPECT_TRUE(is_valid_layout(s.packing.sizes, s.packing.positions, s.bounds));
    }
    EXPECT_TRUE(result.is_complete());
}

TEST(SheetAllocator, ItemLargerThanSheetStaysUnplaced) {
    shelf_oracle oracle;

    auto result = allocate_sheets({size(7, 7)}, size(5, 5), oracle);

    EXPECT_TRUE(result.sheets.empty());
    ASSERT_EQ(result.unplaced.size(), 1u);
    EXPECT_EQ(result.unplaced[0].index, 0u);
    EXPECT_EQ(result.unplaced[0].item_size, size(7, 7));
    EXPECT_EQ(result.reason, stop_reason::stalled);
    EXPECT_FALSE(result.is_complete());
}

TEST(SheetAllocator, LeftoversAreReportedAfterPartialAllocation) {
    shelf_oracle oracle;

    auto result = allocate_sheets({size(2, 2), size(9, 9), size(2, 2)}, size(4, 2), oracle);

    ASSERT_EQ(result.sheets.size(), 1u);
    EXPECT_EQ(result.sheets[0].item_indexes, (std::vector<std::size_t>{0, 2}));
    ASSERT_EQ(result.unplaced.size(), 1u);
    EXPECT_EQ(result.unplaced[0].index, 1u);
    EXPECT_EQ(result.reason, stop_reason::stalled);
}

TEST(SheetAllocator, SheetLimitStopsAllocation) {
    shelf_oracle oracle;

    auto result = allocate_sheets(size_list(5, size(2, 2)), size(4, 2), oracle,
                                  allocator_props().set_max_sheets(2));

    EXPECT_EQ(result.sheets.size(), 2u);
    ASSERT_EQ(result.unplaced.size(), 1u);
    EXPECT_EQ(result.unplaced[0].index, 4u);
    EXPECT_EQ(result.reason, stop_reason::sheet_limit);
}

TEST(SheetAllocator, EveryItemIsPlacedOnceOrLeftOver) {
    shelf_oracle oracle;
    size_list sizes = {
        size(6, 4), size(4, 6), size(6, 4),
        size(5, 5), size(5, 5),
        size(3, 7), size(7, 3),
        size(12, 2),
        size(1, 1),
    };

    auto result = allocate_sheets(sizes, size(10, 10), oracle);

    std::vector<int> seen(sizes.size(), 0);
    for(auto const& s : result.sheets) {
        ASSERT_EQ(s.item_indexes.size(), s.packing.sizes.size());
        EXPECT_TRUE(is_valid_layout(s.packing.sizes, s.packing.positions, s.bounds));
        for(std::size_t k = 0; k < s.item_indexes.size(); ++k) {
            auto const index = s.item_indexes[k];
            ++seen[index];
            EXPECT_EQ(s.packing.sizes[k].canonical(), sizes[index].canonical());
        }
    }
    for(auto const& leftover : result.unplaced) {
        ++seen[leftover.index];
        EXPECT_EQ(leftover.item_size, sizes[leftover.index]);
    }

    EXPECT_TRUE(std::all_of(seen.begin(), seen.end(), [](int n) { return n == 1; }));
    EXPECT_EQ(result.placed_count() + result.unplaced.size(), sizes.size());

    // only the 12x2 strip can't fit a 10x10 sheet
    ASSERT_EQ(result.unplaced.size(), 1u);
    EXPECT_EQ(result.unplaced[0].index, 7u);
}

TEST(SheetAllocator, EmptyInputYieldsNoSheets) {
    shelf_oracle oracle;

    auto result = allocate_sheets(size_list(), size(4, 4), oracle);

    EXPECT_TRUE(result.sheets.empty());
    EXPECT_TRUE(result.is_complete());
    EXPECT_EQ(oracle.calls, 0);
}

TEST(SheetAllocator, RejectsMalformedInput) {
    shelf_oracle oracle;
    EXPECT_THROW(allocate_sheets({size(1, 0)}, size(4, 4), oracle), invalid_input_error);
    EXPECT_THROW(allocate_sheets({size(1, 1)}, size(4, -4), oracle), invalid_input_error);
}

TEST(SheetAllocator, StopReasonNames) {
    EXPECT_STREQ(to_string(stop_reason::completed), "completed");
    EXPECT_STREQ(to_string(stop_reason::stalled), "stalled");
    EXPECT_STREQ(to_string(stop_reason::sheet_limit), "sheet_limit");
}
