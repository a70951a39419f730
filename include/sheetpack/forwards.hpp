#pragma once

#include <memory>
#include <vector>

// Here are necessary forwards of the core types

namespace sheetpack {

    struct size;
    struct offset;
    struct shape_group;
    struct subset_candidate;
    struct packing_result;
    struct sheet;
    struct pool_item;
    struct allocation_result;

    using size_list = std::vector<size>;
    using offset_list = std::vector<offset>;

    class placement_oracle;
    using placement_oracle_ptr = std::shared_ptr<placement_oracle>;

} // sheetpack
