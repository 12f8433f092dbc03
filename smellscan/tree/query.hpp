#ifndef SMELLSCAN_TREE_QUERY_HPP
#define SMELLSCAN_TREE_QUERY_HPP

#pragma once

#include "syntax_node.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace smellscan::tree {

inline constexpr std::string_view kUnknownName = "unknown";

// All nodes of the given kind under root (root included), in pre-order.
// Subtrees the parser marked as errors are not searched.
std::vector<const Node*> find_definitions(const Node &root, NodeKind kind);

// Text of the first identifier among the direct children, or fallback
std::string name_of(const Node &definition, std::string_view fallback = kUnknownName);

// Name a call site refers to: a bare callee identifier, or for an attribute
// callee the first identifier directly under it ("obj" in obj.run(), "y"
// in a.x.y() where the receiver is itself an attribute). nullopt when the
// callee is neither, e.g. a subscript or another call.
std::optional<std::string> call_name_of(const Node &call);

// Function definitions placed directly in the class body block
std::vector<const Node*> methods_of(const Node &class_node);

// "getUserName" and "get_user_name" both give {"get", "user", "name"}
std::vector<std::string> split_identifier(std::string_view name);

} // namespace smellscan::tree

#endif // SMELLSCAN_TREE_QUERY_HPP
