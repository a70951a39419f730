#pragma once

#include "forwards.hpp"

/// Generic interface for building sheets.
class sheet_builder {
public:
    virtual ~sheet_builder() { ;; }
    
    /// Creates a new sheet and set it as active
    virtual bool begin_sheet(sheet_props const& props) = 0;
    
    /// Inserts an item to the active sheet
    virtual bool add_sheet_item(sheet_item const& item) = 0;
    
    /// Reports an item which didn't make it onto any sheet
    virtual bool add_unplaced_item(sheet_item const& item) { return true; }
    
    /// Finishes building of the active sheet.
    virtual bool end_sheet(bool finalize) = 0;
    
    /// Resets builder settings
    virtual void reset() { ;; }
};
