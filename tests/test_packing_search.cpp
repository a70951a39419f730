#include <gtest/gtest.h>

#include "test_oracles.hpp"
#include <sheetpack/packing_search.hpp>
#include <sheetpack/rotation_enumerator.hpp>
#include <sheetpack/errors.hpp>

using namespace sheetpack;

TEST(OptimalPacking, PicksTheDensestRotation) {
    scripted_oracle oracle;
    oracle.feasible({size(2, 1), size(2, 1)}, 0.5);
    oracle.feasible({size(1, 2), size(1, 2)}, 0.8);

    packing_result result;
    ASSERT_TRUE(find_optimal_packing({size(1, 2), size(2, 1)}, size(10, 10), oracle, result));

    EXPECT_EQ(oracle.attempts.size(), 3u);
    EXPECT_EQ(result.sizes, (size_list{size(1, 2), size(1, 2)}));
    EXPECT_DOUBLE_EQ(result.density, 0.8);
    EXPECT_EQ(result.positions.size(), result.sizes.size());
}

TEST(OptimalPacking, FirstSeenWinsTies) {
    scripted_oracle oracle;
    oracle.feasible({size(2, 1), size(2, 1)}, 0.7);
    oracle.feasible({size(1, 2), size(2, 1)}, 0.7);
    oracle.feasible({size(1, 2), size(1, 2)}, 0.7);

    packing_result result;
    ASSERT_TRUE(find_optimal_packing({size(1, 2), size(1, 2)}, size(10, 10), oracle, result));

    EXPECT_EQ(result.sizes, (size_list{size(2, 1), size(2, 1)}));
}

TEST(OptimalPacking, NoFeasibleRotationIsReported) {
    shelf_oracle oracle;
    packing_result result;
    result.density = 0.25;

    EXPECT_FALSE(find_optimal_packing({size(1, 10)}, size(5, 5), oracle, result));
    EXPECT_EQ(oracle.calls, 2);
    EXPECT_TRUE(result.empty());
    EXPECT_DOUBLE_EQ(result.density, 0.25);
}

TEST(OptimalPacking, ResultIsMaximalOverTriedRotations) {
    shelf_oracle oracle;
    size_list sizes = {size(4, 1), size(4, 1), size(1, 3), size(2, 2)};
    size const bin(5, 4);

    packing_result result;
    ASSERT_TRUE(find_optimal_packing(sizes, bin, oracle, result));
    EXPECT_TRUE(is_valid_layout(result.sizes, result.positions, bin));

    for(auto const& oriented : find_rotations(sizes)) {
        offset_list positions;
        if(oracle.attempt_pack(oriented, bin, positions))
            EXPECT_LE(oracle.density(oriented, positions), result.density);
    }
}

TEST(OptimalPacking, RejectsInvalidBin) {
    shelf_oracle oracle;
    packing_result result;
    EXPECT_THROW(find_optimal_packing({size(1, 1)}, size(0, 5), oracle, result), invalid_input_error);
}

TEST(MaxUsage, IdenticalSquaresFillTheBin) {
    shelf_oracle oracle;
    packing_result result;

    ASSERT_TRUE(find_max_usage(size_list(5, size(2, 2)), size(10, 2), oracle, max_usage_props(), result));

    EXPECT_EQ(result.sizes.size(), 5u);
    EXPECT_TRUE(is_valid_layout(result.sizes, result.positions, size(10, 2)));
}

TEST(MaxUsage, FirstFeasibleSubsetInAreaOrderWins) {
    shelf_oracle oracle;
    packing_result result;
    size_list sizes = {size(3, 3), size(2, 4)};

    ASSERT_TRUE(find_max_usage(sizes, size(4, 4), oracle,
                               max_usage_props().set_threshold(boost::none), result));
    EXPECT_EQ(result.sizes, (size_list{size(3, 3)}));

    // 9 of 16 is below the default 90% coverage
    EXPECT_FALSE(find_max_usage(sizes, size(4, 4), oracle, max_usage_props(), result));
}

TEST(MaxUsage, EqualAreaSubsetsNeedExhaustiveMode) {
    scripted_oracle oracle;
    oracle.feasible({size(2, 2)}, 0.5);
    oracle.feasible({size(1, 4)}, 0.9);
    size_list sizes = {size(1, 4), size(2, 2)};
    auto const props = max_usage_props().set_threshold(boost::none);

    packing_result greedy;
    ASSERT_TRUE(find_max_usage(sizes, size(4, 4), oracle, props, greedy));
    EXPECT_EQ(greedy.sizes, (size_list{size(2, 2)}));

    packing_result exhaustive;
    ASSERT_TRUE(find_max_usage(sizes, size(4, 4), oracle, max_usage_props(props).enable_exhaustive(), exhaustive));
    EXPECT_EQ(exhaustive.sizes, (size_list{size(1, 4)}));
    EXPECT_DOUBLE_EQ(exhaustive.density, 0.9);
}

TEST(MaxUsage, ExhaustiveModeNeverTradesAreaForDensity) {
    scripted_oracle oracle;
    oracle.feasible({size(2, 2), size(1, 4)}, 0.4);
    oracle.feasible({size(1, 4)}, 1.0);

    packing_result result;
    ASSERT_TRUE(find_max_usage({size(1, 4), size(2, 2)}, size(4, 4), oracle,
                               max_usage_props().set_threshold(boost::none).enable_exhaustive(), result));
    EXPECT_EQ(result.sizes.size(), 2u);
}

TEST(MaxUsage, ItemLargerThanBinHasNoPacking) {
    shelf_oracle oracle;
    packing_result result;

    EXPECT_FALSE(find_max_usage({size(7, 7)}, size(5, 5), oracle,
                                max_usage_props().set_threshold(boost::none), result));
    EXPECT_FALSE(find_max_usage({size(1, 10)}, size(5, 5), oracle,
                                max_usage_props().set_threshold(boost::none), result));
}
