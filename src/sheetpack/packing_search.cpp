#include <sheetpack/packing_search.hpp>
#include <sheetpack/rotation_enumerator.hpp>
#include <sheetpack/subset_enumerator.hpp>
#include <sheetpack/errors.hpp>
#include <sstream>
#include <easylogging++.h>

#define MODULE_LOGGER "packing_search"

using namespace ::std;

namespace sheetpack {

namespace {

    void validateBin(size const& bin) {
        if(!bin.is_valid()) {
            ostringstream msg;
            msg << "Invalid bin size " << bin;
            throw invalid_input_error(msg.str());
        }
    }

} // anonymous

bool find_optimal_packing(size_list const& sizes,
                          size const& bin,
                          placement_oracle& oracle,
                          packing_result& result)
{
    validateBin(bin);
    CLOG(DEBUG, MODULE_LOGGER) << "Trying " << count_rotation_combinations(sizes)
                               << " unique rotation sets of " << sizes.size() << " items";
    auto const rotations = find_rotations(sizes);

    bool found = false;
    packing_result best;
    offset_list positions;
    for(auto const& oriented : rotations) {
        positions.clear();
        if(!oracle.attempt_pack(oriented, bin, positions))
            continue;

        // Assume the best solution has the highest density
        double density = oracle.density(oriented, positions);
        if(!found || density > best.density) {
            found = true;
            best.sizes = oriented;
            best.positions = positions;
            best.density = density;
        }
    }

    if(!found) {
        CLOG(DEBUG, MODULE_LOGGER) << "No solution found within " << bin;
        return false;
    }

    CLOG(DEBUG, MODULE_LOGGER) << "Best density: " << best.density;
    result = move(best);
    return true;
}

bool find_max_usage(size_list const& sizes,
                    size const& bin,
                    placement_oracle& oracle,
                    max_usage_props const& props,
                    packing_result& result)
{
    validateBin(bin);
    const long long binArea = bin.area();
    auto const subsets = find_sorted_subsets(sizes, binArea, props.threshold);
    CLOG(INFO, MODULE_LOGGER) << "Found " << subsets.size()
                              << " sets of " << sizes.size() << " items that fit within " << bin;

    bool found = false;
    long long bestArea = 0;
    packing_result best;
    for(size_t i = 0; i < subsets.size(); ++i) {
        auto const& subset = subsets[i];

        // Subsets go in descending area order, nothing below the winner counts
        if(found && subset.area < bestArea)
            break;

        CLOG(DEBUG, MODULE_LOGGER) << "Trying set " << (i + 1) << " of " << subsets.size()
                                   << ", area " << subset.area;
        packing_result packing;
        if(!find_optimal_packing(subset.items, bin, oracle, packing))
            continue;

        if(!found || packing.density > best.density) {
            found = true;
            bestArea = subset.area;
            best = move(packing);
        }

        // The first valid solution is the best one unless ties are explored
        if(!props.exhaustive)
            break;
    }

    if(!found) {
        CLOG(INFO, MODULE_LOGGER) << "No solutions found!";
        return false;
    }

    CLOG(INFO, MODULE_LOGGER) << "Best area usage: " << bestArea << " of " << binArea
                              << " (" << (100.0 * bestArea / binArea) << "%)";
    result = move(best);
    return true;
}

} // sheetpack
