#pragma once

#include "forwards.hpp"
#include <cstddef>

namespace sheetpack {

    /// Alternatives of one group. Each alternative is a whole list of items.
    template<typename T>
    using group_options = std::vector<std::vector<T>>;

    /**
     * @brief Visits the Cartesian product of the groups' options.
     * Every combination is passed to the visitor as the concatenation of
     * the prefix and one option of each group. The last group varies fastest.
     * An empty group list yields the prefix alone; a group without options
     * yields nothing.
     */
    template<typename T, typename Visitor>
    void for_each_combination(std::vector<T> const& prefix,
                              std::vector<group_options<T>> const& groups,
                              Visitor&& visit)
    {
        for(auto const& options : groups) {
            if(options.empty())
                return;
        }

        std::vector<std::size_t> odometer(groups.size(), 0);
        std::vector<T> combination;

        while(true) {
            combination = prefix;
            for(std::size_t g = 0; g < groups.size(); ++g) {
                auto const& option = groups[g][odometer[g]];
                combination.insert(combination.end(), option.begin(), option.end());
            }
            visit(combination);

            // advance the odometer
            std::size_t g = groups.size();
            while(g > 0) {
                --g;
                if(++odometer[g] < groups[g].size())
                    break;
                odometer[g] = 0;
                if(g == 0)
                    return;
            }
            if(groups.empty())
                return;
        }
    }

} // sheetpack
