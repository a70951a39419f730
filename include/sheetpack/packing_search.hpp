#pragma once

#include "placement_oracle.hpp"
#include <boost/optional.hpp>

namespace sheetpack {

    /// Max-usage search preferences
    struct max_usage_props {
        using props = max_usage_props;

        /// Minimal share of the bin area a subset must cover. None accepts any subset.
        boost::optional<double> threshold = 0.9;

        /// Evaluate all subsets of the winning area and keep the densest one
        bool exhaustive = false;

        /// Sets the coverage threshold
        props& set_threshold(boost::optional<double> arg) { threshold = arg; return *this; }
        /// Enables the exhaustive mode
        props& enable_exhaustive(bool arg=true) { exhaustive = arg; return *this; }
    };

    /**
     * @brief Finds the densest packing of all the sizes into one bin.
     * Every unique rotation assignment is tried; the result is replaced only
     * on a strictly higher density.
     * @return false if no rotation assignment fits
     * @throw invalid_input_error on a malformed size or bin
     */
    bool find_optimal_packing(size_list const& sizes,
                              size const& bin,
                              placement_oracle& oracle,
                              packing_result& result);

    /**
     * @brief Finds the subset of sizes covering the most of one bin.
     * Subsets are tried in descending area order and the first one that packs
     * wins. This is an area-first greedy choice: an equal-area subset ranked
     * later is not considered unless the exhaustive mode is on.
     * @return false if no subset fits
     * @throw invalid_input_error on a malformed size, bin or threshold
     */
    bool find_max_usage(size_list const& sizes,
                        size const& bin,
                        placement_oracle& oracle,
                        max_usage_props const& props,
                        packing_result& result);

} // sheetpack
