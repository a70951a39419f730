#pragma once

#include "shape_groups.hpp"
#include "combinations.hpp"
#include <cstddef>

namespace sheetpack {

    /**
     * @brief Returns every distinct orientation sequence of N identical shapes.
     * Identical items are not distinguished, so a rotatable shape yields N+1
     * sequences: the i-th one holds i copies in the given orientation followed
     * by N-i swapped copies. A square shape yields a single unrotated sequence.
     * @throw invalid_input_error on a malformed shape or a negative count
     */
    group_options<size> unique_rotation_combinations(size const& shape, int count);

    /**
     * @brief Finds all unique rotation assignments of an arbitrary item list.
     * Square items form a fixed prefix; rotatable groups are combined as the
     * Cartesian product of their sequences.
     * @throw invalid_input_error on a malformed size
     */
    std::vector<size_list> find_rotations(size_list const& sizes);

    /// Number of sequences find_rotations() would produce
    std::size_t count_rotation_combinations(size_list const& sizes);

} // sheetpack
