#include "syntax_node.hpp"
#include <utility>

namespace smellscan::tree {

std::string_view to_string(NodeKind kind) {
    switch (kind) {
    case NodeKind::Module:
        return "module";
    case NodeKind::FunctionDefinition:
        return "function_definition";
    case NodeKind::ClassDefinition:
        return "class_definition";
    case NodeKind::DecoratedDefinition:
        return "decorated_definition";
    case NodeKind::Block:
        return "block";
    case NodeKind::Identifier:
        return "identifier";
    case NodeKind::Parameters:
        return "parameters";
    case NodeKind::TypedParameter:
        return "typed_parameter";
    case NodeKind::DefaultParameter:
        return "default_parameter";
    case NodeKind::TypedDefaultParameter:
        return "typed_default_parameter";
    case NodeKind::ListSplatPattern:
        return "list_splat_pattern";
    case NodeKind::DictionarySplatPattern:
        return "dictionary_splat_pattern";
    case NodeKind::IfStatement:
        return "if_statement";
    case NodeKind::ForStatement:
        return "for_statement";
    case NodeKind::WhileStatement:
        return "while_statement";
    case NodeKind::WithStatement:
        return "with_statement";
    case NodeKind::TryStatement:
        return "try_statement";
    case NodeKind::Call:
        return "call";
    case NodeKind::Attribute:
        return "attribute";
    case NodeKind::Error:
        return "error";
    case NodeKind::Other:
        return "other";
    }
    return "other";
}

Node::~Node() {
    if (children.empty()) {
        return;
    }

    // Detach every grandchild before its parent goes, so each destructor
    // below only ever sees childless nodes
    std::vector<Node> pending = std::move(children);
    while (!pending.empty()) {
        Node node = std::move(pending.back());
        pending.pop_back();
        for (auto& child : node.children) {
            pending.push_back(std::move(child));
        }
        node.children.clear();
    }
}

} // namespace smellscan::tree
