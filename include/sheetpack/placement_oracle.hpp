#pragma once

#include "geometry.hpp"

namespace sheetpack {

    /// Placed items of one bin
    struct packing_result {
        size_list sizes;            ///< Oriented sizes in placement order
        offset_list positions;      ///< Position of each size, same index
        double density = 0;         ///< Oracle provided packing score

        bool empty() const { return sizes.empty(); }
    };

    /**
     @brief Generic interface of a placement oracle.
     The oracle lays out an ordered list of rectangles in a bounded bin without
     any overlap, or reports that it can't.
     */
    class placement_oracle {
    public:
        virtual ~placement_oracle() { ;; }

        /**
         * @brief Places every size, in order, into the bin.
         * On success positions[i] holds the position of sizes[i]; all the
         * rectangles lie within the bin and don't overlap. The result must be
         * deterministic for the same input.
         * @return false if the sizes don't fit
         */
        virtual bool attempt_pack(size_list const& sizes, size const& bin, offset_list& positions) = 0;

        /// Returns the packing score in (0,1]. The higher the better.
        virtual double density(size_list const& sizes, offset_list const& positions) const = 0;
    };

} // sheetpack
