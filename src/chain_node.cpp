#include "chain_node.hpp"

using namespace ::std;

namespace {
    
    /// The class safely forwards any calls to a specific node.
    class safe_forwarder: public sheet_builder {
    public:
        bool begin_sheet(sheet_props const& props) override {
            return node ? node->begin_sheet(props) : true;
        }
        
        bool add_sheet_item(sheet_item const& item) override {
            return node ? node->add_sheet_item(item) : true;
        }
        
        bool add_unplaced_item(sheet_item const& item) override {
            return node ? node->add_unplaced_item(item) : true;
        }
        
        bool end_sheet(bool finalize) override {
            return node ? node->end_sheet(finalize) : true;
        }
        
        void reset() override {
            if(node)
                node->reset();
        }
        
    public:
        chain_node_ptr node;
    };
    
}

struct chain_node::Pimpl {
    safe_forwarder forwarder;
};

chain_node::chain_node(): _pimpl(new Pimpl) {
    ;;
}

chain_node::~chain_node() {
    ;;
}

sheet_builder& chain_node::safe_fwd() {
    return _pimpl->forwarder;
}

chain_node_ptr chain_node::set_child(chain_node_ptr child) {
    _pimpl->forwarder.node = move(child);
    return _pimpl->forwarder.node;
}

chain_node_ptr chain_node::child_node() const {
    return _pimpl->forwarder.node;
}

bool chain_node::add_unplaced_item(sheet_item const& item) {
    return safe_fwd().add_unplaced_item(item);
}
