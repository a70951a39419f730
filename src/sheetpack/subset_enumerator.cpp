#include <sheetpack/subset_enumerator.hpp>
#include <sheetpack/errors.hpp>
#include <algorithm>
#include <sstream>

using namespace ::std;

namespace sheetpack {

namespace {

    void validateBudget(long long areaBudget, boost::optional<double> const& threshold) {
        if(areaBudget <= 0) {
            ostringstream msg;
            msg << "Area budget must be positive, got " << areaBudget;
            throw invalid_input_error(msg.str());
        }

        if(threshold && (*threshold <= 0.0 || *threshold > 1.0)) {
            ostringstream msg;
            msg << "Coverage threshold must be in (0,1], got " << *threshold;
            throw invalid_input_error(msg.str());
        }
    }

    // Sorting candidates by area
    bool sortByArea(subset_candidate const& a, subset_candidate const& b) {
        return a.area > b.area;
    }

} // anonymous

group_options<size> unique_keep_combinations(size const& shape, int count) {
    group_options<size> output;
    for(int i = 0; i <= count; ++i)
        output.push_back(size_list(i, shape));
    return output;
}

subset_list find_sorted_subsets(size_list const& sizes,
                                long long areaBudget,
                                boost::optional<double> const& threshold)
{
    validateBudget(areaBudget, threshold);

    vector<group_options<size>> keepOptions;
    for(auto const& group : make_shape_groups(sizes))
        keepOptions.push_back(unique_keep_combinations(group.shape, group.count));

    const double minArea = threshold ? *threshold * (double)areaBudget : 0.0;

    subset_list output;
    for_each_combination(size_list(), keepOptions, [&](size_list const& items) {
        if(items.empty())
            return;

        long long area = total_area(items);
        if(area <= 0 || area > areaBudget || (double)area < minArea)
            return;

        subset_candidate candidate;
        candidate.items = items;
        candidate.area = area;
        output.push_back(move(candidate));
    });

    stable_sort(output.begin(), output.end(), &sortByArea);
    return output;
}

} // sheetpack
