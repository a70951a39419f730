#pragma once

#include "geometry.hpp"

namespace sheetpack {

    /// Identical shapes regardless of their orientation
    struct shape_group {
        size shape;     ///< Canonical shape of the group
        int count = 0;  ///< Multiplicity

        shape_group() { ;; }
        shape_group(size const& s, int n)
        : shape(s), count(n)
        { ;; }

        /// Rotation of the group members is meaningless
        bool is_symmetric() const { return shape.is_square(); }
    };

    using shape_group_list = std::vector<shape_group>;

    /// Throws invalid_input_error if any size is not a positive pair of dimensions
    void validate_sizes(size_list const& sizes);

    /**
     * @brief Partitions sizes by their canonical form.
     * Groups keep the order in which their shape first appears in the input.
     * @throw invalid_input_error on a malformed size
     */
    shape_group_list make_shape_groups(size_list const& sizes);

} // sheetpack
