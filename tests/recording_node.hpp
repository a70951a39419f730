#pragma once

#include "chain_node.hpp"
#include "helpers.hpp"
#include <vector>

/// Remembers everything passed down the chain
class recording_node: public chain_node {
public:
    struct recorded_sheet {
        sheet_props props;
        std::vector<sheet_item> items;
        bool finalized = false;
    };

    bool begin_sheet(sheet_props const& props) override {
        recorded_sheet entry;
        entry.props = props;
        sheets.push_back(entry);
        return safe_fwd().begin_sheet(props);
    }

    bool add_sheet_item(sheet_item const& item) override {
        if(sheets.empty())
            return false;
        sheets.back().items.push_back(item);
        return safe_fwd().add_sheet_item(item);
    }

    bool add_unplaced_item(sheet_item const& item) override {
        unplaced.push_back(item);
        return safe_fwd().add_unplaced_item(item);
    }

    bool end_sheet(bool finalize) override {
        ++ended;
        if(!sheets.empty())
            sheets.back().finalized = finalize;
        return safe_fwd().end_sheet(finalize);
    }

    void reset() override {
        ++resets;
        safe_fwd().reset();
    }

    std::vector<recorded_sheet> sheets;
    std::vector<sheet_item> unplaced;
    int ended = 0;
    int resets = 0;
};
