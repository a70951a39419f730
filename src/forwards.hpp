#pragma once

#include <sheetpack/forwards.hpp>
#include <memory>
#include <functional>
#include <string>

// Here are necessary forwards of some basic types

struct rect;
struct sheet_item;
struct sheet_props;

class chain_node;
using chain_node_ptr = std::shared_ptr<chain_node>;

class sheet_builder;
using sheet_builder_ptr = std::shared_ptr<sheet_builder>;

class bin_packer;
using bin_packer_ptr = std::shared_ptr<bin_packer>;

