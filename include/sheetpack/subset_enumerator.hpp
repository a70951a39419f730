#pragma once

#include "shape_groups.hpp"
#include "combinations.hpp"
#include <boost/optional.hpp>

namespace sheetpack {

    /// A selection of items to keep with its total area
    struct subset_candidate {
        size_list items;    ///< Kept items in their canonical orientation
        long long area = 0; ///< Total area of the kept items
    };

    using subset_list = std::vector<subset_candidate>;

    /// Returns the N+1 keep-count options (0..N copies) of a group
    group_options<size> unique_keep_combinations(size const& shape, int count);

    /**
     * @brief Finds every distinct selection of items fitting the area budget.
     * Candidates satisfy 0 < area <= area_budget and, when a threshold is
     * given, area >= threshold * area_budget. The result is sorted by area,
     * descending; equal areas keep their generation order.
     * @throw invalid_input_error on a malformed size, a non-positive budget or
     * a threshold outside (0,1]
     */
    subset_list find_sorted_subsets(size_list const& sizes,
                                    long long area_budget,
                                    boost::optional<double> const& threshold = boost::none);

} // sheetpack
