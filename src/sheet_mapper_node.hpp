#pragma once

#include "chain_node.hpp"
#include <boost/optional.hpp>
#include <cstddef>

/// Sheet mapper properties
struct sheet_mapper_props {
    /// Search performed over the collected items
    enum search_mode {
        multi_sheet = 0,    ///< Fill as many sheets as needed
        max_usage,          ///< Fill one sheet with the best covering subset
        optimal_packing,    ///< Pack all the items onto one sheet
    };

    search_mode mode = search_mode::multi_sheet;        ///< Search mode
    sheetpack::placement_oracle_ptr oracle;             ///< Placement oracle
    boost::optional<double> threshold = 0.9;            ///< Coverage threshold of the max_usage mode
    bool exhaustive = false;                            ///< Explore equal-area subsets
    std::size_t max_sheets = 0;                         ///< Sheets limit of the multi_sheet mode, 0 is unlimited
};


/// The node maps items onto a bunch of sheets
class sheet_mapper_node: public chain_node {
public:
    struct init_props: sheet_mapper_props {
        using props = init_props;
        
        /// Set search mode
        props& set_mode(search_mode arg) {mode = arg; return *this;}
        /// Set placement oracle
        props& set_oracle(sheetpack::placement_oracle_ptr arg) {oracle = std::move(arg); return *this;}
        /// Set coverage threshold
        props& set_threshold(boost::optional<double> arg) {threshold = arg; return *this;}
        /// Enable exhaustive search
        props& enable_exhaustive(bool arg=true) {exhaustive = arg; return *this;}
        /// Set sheets limit
        props& set_max_sheets(std::size_t arg) {max_sheets = arg; return *this;}
    };
    
    explicit sheet_mapper_node(sheet_mapper_props const& props);
    virtual ~sheet_mapper_node();
    
    virtual bool begin_sheet(sheet_props const& sheet) override;
    virtual bool add_sheet_item(sheet_item const& item) override;
    virtual bool end_sheet(bool finalize) override;
    virtual void reset() override;
    
private:
    struct Pimpl;
    std::unique_ptr<Pimpl> _pimpl;
};

