#ifndef SMELLSCAN_TREE_SYNTAX_NODE_HPP
#define SMELLSCAN_TREE_SYNTAX_NODE_HPP

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace smellscan::tree {

// Syntactic kinds relevant to smell detection. Anything else maps to Other
// and keeps its grammar tag in Node::type.
enum class NodeKind {
    Module,
    FunctionDefinition,
    ClassDefinition,
    DecoratedDefinition,
    Block,
    Identifier,
    Parameters,
    TypedParameter,
    DefaultParameter,
    TypedDefaultParameter,
    ListSplatPattern,
    DictionarySplatPattern,
    IfStatement,
    ForStatement,
    WhileStatement,
    WithStatement,
    TryStatement,
    Call,
    Attribute,
    Error,
    Other
};

std::string_view to_string(NodeKind kind);

// Zero-based, as reported by the parser
struct Point {
    size_t row{0};
    size_t column{0};
};

struct Node {
    Node() = default;
    Node(const Node&) = default;
    Node(Node&&) noexcept = default;
    Node& operator=(const Node&) = default;
    Node& operator=(Node&&) noexcept = default;
    // Releases descendants without recursing once per level
    ~Node();

    NodeKind kind{NodeKind::Other};
    std::string type;
    Point start;
    Point end;
    // Only populated for leaves
    std::string text;
    std::vector<Node> children;

    bool is_leaf() const { return children.empty(); }
};

// One parsed source unit. The core only borrows nodes from it.
struct SyntaxTree {
    Node root;
    std::string file_path;
    std::string source;
};

} // namespace smellscan::tree

#endif // SMELLSCAN_TREE_SYNTAX_NODE_HPP
