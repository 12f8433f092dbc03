#include "query.hpp"
#include <cctype>
#include <spdlog/spdlog.h>
#include <stack>

namespace smellscan::tree {

std::vector<const Node*> find_definitions(const Node &root, NodeKind kind) {
    std::vector<const Node*> found;
    std::stack<const Node*> nodes;
    nodes.push(&root);

    while (!nodes.empty()) {
        const Node* current = nodes.top();
        nodes.pop();

        if (current->kind == NodeKind::Error) {
            spdlog::debug("Skipping malformed subtree at line {}", current->start.row + 1);
            continue;
        }

        if (current->kind == kind) {
            found.push_back(current);
        }

        // Reverse push keeps siblings in source order
        for (auto it = current->children.rbegin(); it != current->children.rend(); ++it) {
            nodes.push(&*it);
        }
    }

    spdlog::debug("Found {} {} nodes", found.size(), to_string(kind));
    return found;
}

std::string name_of(const Node &definition, std::string_view fallback) {
    for (const auto& child : definition.children) {
        if (child.kind == NodeKind::Identifier) {
            return child.text;
        }
    }
    return std::string(fallback);
}

std::optional<std::string> call_name_of(const Node &call) {
    for (const auto& child : call.children) {
        if (child.kind == NodeKind::Identifier) {
            return child.text;
        }
        if (child.kind == NodeKind::Attribute) {
            for (const auto& part : child.children) {
                if (part.kind == NodeKind::Identifier) {
                    return part.text;
                }
            }
        }
    }
    return std::nullopt;
}

std::vector<const Node*> methods_of(const Node &class_node) {
    std::vector<const Node*> methods;

    for (const auto& child : class_node.children) {
        if (child.kind != NodeKind::Block) {
            continue;
        }
        for (const auto& item : child.children) {
            if (item.kind == NodeKind::FunctionDefinition) {
                methods.push_back(&item);
            }
        }
    }

    return methods;
}

std::vector<std::string> split_identifier(std::string_view name) {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    };

    for (size_t i = 0; i < name.size(); ++i) {
        const auto c = static_cast<unsigned char>(name[i]);

        if (c == '_' || std::isspace(c)) {
            flush();
            continue;
        }

        // camelCase boundary: uppercase right after lowercase
        if (std::isupper(c) && i > 0 &&
            std::islower(static_cast<unsigned char>(name[i - 1]))) {
            flush();
        }

        current.push_back(static_cast<char>(std::tolower(c)));
    }
    flush();

    return words;
}

} // namespace smellscan::tree
