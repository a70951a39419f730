#include <gtest/gtest.h>

#include "test_oracles.hpp"
#include "rbp_oracle.hpp"
#include "rbp_wrappers.hpp"
#include "helpers.hpp"
#include <sheetpack/sheet_allocator.hpp>
#include <algorithm>

using namespace sheetpack;

namespace {
    /// Always lays the rect flat, the way skyline and guillotine may choose to
    class flipping_packer: public bin_packer {
    public:
        float occupancy() const override { return 0; }
        std::array<int, 2> bin_dims() const override { return {{0, 0}}; }
        void clean_bin() override { ;; }

        bool insert_rect(int width, int height, sheet_item& item) override {
            int const flat = (std::max)(width, height), tall = (std::min)(width, height);
            item.box = rect(0, 0, flat, tall);
            item.rotated = flat != width;
            return true;
        }
    };

    std::shared_ptr<rbp_oracle> makeOracle(packer_kind kind = packer_kind::max_rects) {
        return std::make_shared<rbp_oracle>(rbp_oracle::init_props()
                                            .set_bin_factory([kind](int w, int h) { return create_bin_packer(kind, w, h); }));
    }
}

TEST(RbpWrappers, PackerKindsByName) {
    packer_kind kind = packer_kind::max_rects;
    ASSERT_TRUE(packer_kind_from_name("skyline", kind));
    EXPECT_EQ(kind, packer_kind::skyline);
    ASSERT_TRUE(packer_kind_from_name("guillotine", kind));
    EXPECT_EQ(kind, packer_kind::guillotine);
    ASSERT_TRUE(packer_kind_from_name("maxrects", kind));
    EXPECT_EQ(kind, packer_kind::max_rects);
    EXPECT_FALSE(packer_kind_from_name("shelf", kind));
}

TEST(RbpWrappers, CreatedBinHasRequestedDimensions) {
    auto packer = create_bin_packer(packer_kind::max_rects, 12, 7);
    ASSERT_TRUE(packer);
    EXPECT_EQ(packer->bin_dims()[0], 12);
    EXPECT_EQ(packer->bin_dims()[1], 7);

    sheet_item item;
    ASSERT_TRUE(packer->insert_rect(12, 7, item));
    EXPECT_EQ(item.box.width, 12);
    EXPECT_EQ(item.box.height, 7);
    EXPECT_FALSE(item.rotated);
    EXPECT_FLOAT_EQ(packer->occupancy(), 1.0f);
}

TEST(RbpWrappers, MaxRectsNeverFlipsItems) {
    auto packer = create_bin_packer(packer_kind::max_rects, 3, 1);

    sheet_item item;
    EXPECT_FALSE(packer->insert_rect(1, 3, item));
    ASSERT_TRUE(packer->insert_rect(3, 1, item));
    EXPECT_FALSE(item.rotated);
}

TEST(RbpOracle, RejectsPackerRotation) {
    rbp_oracle oracle(rbp_oracle::init_props()
                      .set_bin_factory([](int, int) { return std::make_shared<flipping_packer>(); }));
    offset_list positions;

    EXPECT_FALSE(oracle.attempt_pack({size(1, 3)}, size(3, 3), positions));
    EXPECT_TRUE(positions.empty());
    EXPECT_TRUE(oracle.attempt_pack({size(3, 1)}, size(3, 3), positions));
    EXPECT_TRUE(oracle.attempt_pack({size(2, 2)}, size(3, 3), positions));
}

TEST(RbpOracle, PacksSquaresIntoExactFit) {
    for(auto kind : {packer_kind::max_rects, packer_kind::skyline, packer_kind::guillotine}) {
        auto oraclePtr = makeOracle(kind);
        auto& oracle = *oraclePtr;
        size_list sizes(4, size(2, 2));
        offset_list positions;

        ASSERT_TRUE(oracle.attempt_pack(sizes, size(4, 4), positions));
        EXPECT_TRUE(is_valid_layout(sizes, positions, size(4, 4)));
        EXPECT_DOUBLE_EQ(oracle.density(sizes, positions), 1.0);
    }
}

TEST(RbpOracle, ReportsInfeasibleSets) {
    auto oraclePtr = makeOracle();
    auto& oracle = *oraclePtr;
    offset_list positions;

    EXPECT_FALSE(oracle.attempt_pack({size(7, 7)}, size(5, 5), positions));
    EXPECT_FALSE(oracle.attempt_pack(size_list(3, size(2, 2)), size(4, 2), positions));
}

TEST(RbpOracle, KeepsRequestedOrientation) {
    auto oraclePtr = makeOracle();
    auto& oracle = *oraclePtr;
    offset_list positions;

    EXPECT_TRUE(oracle.attempt_pack({size(3, 1)}, size(3, 1), positions));
    EXPECT_FALSE(oracle.attempt_pack({size(1, 3)}, size(3, 1), positions));
}

TEST(RbpOracle, DensityIsAreaOverBoundingBox) {
    auto oraclePtr = makeOracle();
    auto& oracle = *oraclePtr;

    EXPECT_DOUBLE_EQ(oracle.density({size(2, 2)}, {offset(0, 0)}), 1.0);
    EXPECT_DOUBLE_EQ(oracle.density({size(2, 2), size(2, 2)}, {offset(0, 0), offset(4, 0)}), 8.0 / 12.0);
    EXPECT_DOUBLE_EQ(oracle.density(size_list(), offset_list()), 0.0);
}

TEST(RbpOracle, DrivesMultiSheetAllocation) {
    auto oraclePtr = makeOracle();
    auto& oracle = *oraclePtr;
    size_list sizes = {size(4, 3), size(4, 3), size(2, 2), size(9, 9)};

    auto result = allocate_sheets(sizes, size(6, 5), oracle);

    EXPECT_GE(result.sheets.size(), 1u);
    for(auto const& s : result.sheets)
        EXPECT_TRUE(is_valid_layout(s.packing.sizes, s.packing.positions, s.bounds));
    ASSERT_EQ(result.unplaced.size(), 1u);
    EXPECT_EQ(result.unplaced[0].index, 3u);
    EXPECT_EQ(result.placed_count(), 3u);
}
