#pragma once

#include "placement_oracle.hpp"
#include <cstddef>

namespace sheetpack {

    /// An input item awaiting placement
    struct pool_item {
        std::size_t index = 0;  ///< Position of the item in the input
        size item_size;         ///< Size as given by the caller

        pool_item() { ;; }
        pool_item(std::size_t i, size const& s)
        : index(i), item_size(s)
        { ;; }
    };

    /// The multiset of items not yet assigned to any sheet
    class item_pool {
    public:
        explicit item_pool(size_list const& sizes);

        bool empty() const { return _items.empty(); }
        std::size_t count() const { return _items.size(); }

        /// Returns the remaining items in input order
        std::vector<pool_item> const& items() const { return _items; }

        /// Returns sizes of the remaining items
        size_list sizes() const;

        /**
         * @brief Removes one item matching a placed size.
         * The first item with the same orientation is taken, otherwise the
         * first swapped one.
         * @return false if nothing matches
         */
        bool take(size const& placed, pool_item& taken);

    private:
        std::vector<pool_item> _items;
    };

    /// One bin filled with a packing
    struct sheet {
        size bounds;                            ///< Bin dimensions
        packing_result packing;                 ///< Placed items
        std::vector<std::size_t> item_indexes;  ///< Input index of each placed item
    };

    /// Why the allocation loop stopped
    enum class stop_reason {
        completed,      ///< Every item was placed
        stalled,        ///< The remaining items can't start a fresh sheet
        sheet_limit,    ///< No more sheets are available
    };

    /// Outcome of the multi-sheet allocation
    struct allocation_result {
        std::vector<sheet> sheets;      ///< Filled sheets in creation order
        std::vector<pool_item> unplaced;///< Items left in the pool
        stop_reason reason = stop_reason::completed;

        bool is_complete() const { return unplaced.empty(); }

        /// Total number of placed items
        std::size_t placed_count() const;
    };

    /// Multi-sheet allocation preferences
    struct allocator_props {
        using props = allocator_props;

        bool exhaustive = false;    ///< Exhaustive max-usage search for each sheet
        std::size_t max_sheets = 0; ///< Available sheets, 0 means unlimited

        /// Enables the exhaustive mode of the max-usage search
        props& enable_exhaustive(bool arg=true) { exhaustive = arg; return *this; }
        /// Limits the number of sheets
        props& set_max_sheets(std::size_t arg) { max_sheets = arg; return *this; }
    };

    /**
     * @brief Fills sheets one by one until every item is placed.
     * Each sheet takes the max-usage subset of the remaining items, accepting
     * any coverage. Items which can't start a fresh sheet are returned as
     * unplaced.
     * @throw invalid_input_error on a malformed size or bin
     */
    allocation_result allocate_sheets(size_list const& sizes,
                                      size const& bin,
                                      placement_oracle& oracle,
                                      allocator_props const& props = allocator_props());

    /// Returns a printable name of the stop reason
    char const* to_string(stop_reason reason);

} // sheetpack
