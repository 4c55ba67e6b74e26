// src/session_context.cpp
// Scope canonicalization shared by every read and write of the session table

#include "sessiondb/session_context.hpp"
#include "sessiondb/errors.hpp"
#include "sessiondb/utils.hpp"
#include <algorithm>

namespace sessiondb {

SessionContext::SessionContext(const NodeId& node_id, const std::string& context_path,
                               const std::string& vhost)
    : node_id_(Utils::trim(node_id))
    , canonical_context_path_(canonicalize_context_path(context_path))
    , vhost_(canonicalize_vhost(vhost)) {
    if (node_id_.empty() || node_id_.length() > 60) {
        throw Errors::invalid_node_id(node_id_);
    }
}

SessionContext SessionContext::with_node(const NodeId& node_id) const {
    SessionContext copy(*this);
    copy.node_id_ = Utils::trim(node_id);
    if (copy.node_id_.empty() || copy.node_id_.length() > 60) {
        throw Errors::invalid_node_id(copy.node_id_);
    }
    return copy;
}

std::string SessionContext::to_string() const {
    return canonical_context_path_ + "_" + vhost_;
}

bool SessionContext::operator==(const SessionContext& other) const noexcept {
    return canonical_context_path_ == other.canonical_context_path_ && vhost_ == other.vhost_;
}

ContextPath SessionContext::canonicalize_context_path(const std::string& context_path) {
    std::string path = Utils::trim(context_path);

    while (!path.empty() && (path.back() == '/' || path.back() == '\\')) {
        path.pop_back();
    }
    if (path.empty()) {
        return ContextPath();
    }

    std::replace(path.begin(), path.end(), '/', '_');
    std::replace(path.begin(), path.end(), '\\', '_');
    std::replace(path.begin(), path.end(), '.', '_');
    return path;
}

VirtualHost SessionContext::canonicalize_vhost(const std::string& vhost) {
    std::string host = Utils::to_lower(Utils::trim(vhost));
    if (host.empty()) {
        return Constants::DEFAULT_VHOST;
    }
    return host;
}

} // namespace sessiondb
