// core/types/link.h
#ifndef FUNCMODEL_CORE_TYPES_LINK_H
#define FUNCMODEL_CORE_TYPES_LINK_H

#include "node.h"
#include <string>

namespace funcmodel {

struct NodeLink {
    std::string id;
    NodeId source;
    NodeId target;
    LinkType type = LinkType::DEPENDENCY;
    LinkStrength strength = LinkStrength::full();
    bool bidirectional = false;
    Value context = Value::object();
    Value metadata = Value::object();
    Timestamp created_at;

    bool connects(const NodeId& a, const NodeId& b) const {
        return (source == a && target == b) || (bidirectional && source == b && target == a);
    }
    bool touches(const NodeId& n) const { return source == n || target == n; }
};

// Links of these types order execution between containers
inline bool is_ordering_link(LinkType type) {
    return type == LinkType::DEPENDENCY;
}

} // namespace funcmodel

#endif // FUNCMODEL_CORE_TYPES_LINK_H
