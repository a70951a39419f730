#pragma once

#include "forwards.hpp"
#include <sheetpack/placement_oracle.hpp>

/// Placement oracle properties
struct rbp_oracle_props {
    using bin_factory = std::function<bin_packer_ptr(int,int)>;
    
    bin_factory create_bin;     ///< Creates an empty bin for each trial
};

/**
 * @brief Placement oracle backed by the rbp bin packers.
 * Sizes are inserted in the given order. A trial fails if any insert fails
 * or if the packer rotates an item. The density is the total area of the
 * items over the area of their bounding box.
 */
class rbp_oracle: public sheetpack::placement_oracle {
public:
    struct init_props: rbp_oracle_props {
        using props = init_props;
        
        /// Set bin factory
        props& set_bin_factory(bin_factory arg) {create_bin=std::move(arg); return *this;}
    };
    
    explicit rbp_oracle(rbp_oracle_props const& props);
    virtual ~rbp_oracle();
    
    bool attempt_pack(sheetpack::size_list const& sizes,
                      sheetpack::size const& bin,
                      sheetpack::offset_list& positions) override;
    
    double density(sheetpack::size_list const& sizes,
                   sheetpack::offset_list const& positions) const override;
    
private:
    struct Pimpl;
    std::unique_ptr<Pimpl> _pimpl;
};
