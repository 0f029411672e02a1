/**
 * @file conflict.cpp
 * @brief Conflict record helpers
 */

#include "tessera/sync/conflict.h"
#include <algorithm>

namespace tessera::sync {

std::vector<OperationId> Conflict::operation_ids() const {
    std::vector<OperationId> ids;
    ids.reserve(operations.size());
    for (const auto& op : operations) {
        ids.push_back(op.id);
    }
    return ids;
}

std::vector<UserId> Conflict::affected_users() const {
    std::vector<UserId> users;
    for (const auto& op : operations) {
        users.push_back(op.user_id);
    }
    std::sort(users.begin(), users.end());
    users.erase(std::unique(users.begin(), users.end()), users.end());
    return users;
}

bool Conflict::involves_existence_change() const {
    return std::any_of(operations.begin(), operations.end(),
                       [](const Operation& op) { return changes_existence(op.type); });
}

SizeT Conflict::conflicting_field_count() const {
    if (const auto* semantic = std::get_if<SemanticEvidence>(&evidence)) {
        return semantic->incompatible_changes.size();
    }
    if (const auto* compound = std::get_if<CompoundEvidence>(&evidence)) {
        return compound->incompatible_changes.size();
    }
    return 0;
}

ConflictId make_conflict_id(ConflictType type, std::vector<OperationId> operation_ids) {
    std::sort(operation_ids.begin(), operation_ids.end());
    ConflictId id = conflict_type_to_string(type);
    for (const auto& op_id : operation_ids) {
        id += "_";
        id += op_id;
    }
    return id;
}

OperationPair make_operation_pair(const OperationId& a, const OperationId& b) {
    return a < b ? OperationPair{a, b} : OperationPair{b, a};
}

} // namespace tessera::sync
