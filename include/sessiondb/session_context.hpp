// include/sessiondb/session_context.hpp
// Purpose: Identifies where a session lives - canonical context path,
// virtual host - and which cluster node currently saves it

#pragma once

#include "types.hpp"
#include <string>

namespace sessiondb {

// Immutable scope descriptor. Equality covers the canonical context path and
// the virtual host only; the node id is the current owner, not an identity field.
class SessionContext {
public:
    SessionContext(const NodeId& node_id, const std::string& context_path,
                   const std::string& vhost = "");

    const NodeId& node_id() const noexcept { return node_id_; }
    const ContextPath& canonical_context_path() const noexcept { return canonical_context_path_; }
    const VirtualHost& vhost() const noexcept { return vhost_; }

    bool is_root() const noexcept { return canonical_context_path_.empty(); }

    // Same scope, different owning node
    SessionContext with_node(const NodeId& node_id) const;

    // "<canonical path>_<vhost>", used in log lines
    std::string to_string() const;

    bool operator==(const SessionContext& other) const noexcept;
    bool operator!=(const SessionContext& other) const noexcept { return !(*this == other); }

    // "" and "/" both denote the root context and map to "".
    // Otherwise trailing separators are dropped and '/', '\' and '.' become '_'.
    static ContextPath canonicalize_context_path(const std::string& context_path);

    // Lower-cased; an empty host maps to Constants::DEFAULT_VHOST
    static VirtualHost canonicalize_vhost(const std::string& vhost);

private:
    NodeId node_id_;
    ContextPath canonical_context_path_;
    VirtualHost vhost_;
};

} // namespace sessiondb
