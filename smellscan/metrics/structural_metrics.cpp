#include "structural_metrics.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stack>
#include <utility>

namespace smellscan::metrics {

using tree::Node;
using tree::NodeKind;

namespace {

bool is_counted_parameter(NodeKind kind) {
    return kind == NodeKind::Identifier ||
           kind == NodeKind::TypedParameter ||
           kind == NodeKind::DefaultParameter;
}

bool opens_scope(NodeKind kind) {
    return kind == NodeKind::FunctionDefinition ||
           kind == NodeKind::ClassDefinition;
}

} // namespace

size_t line_span(const Node &definition) {
    // Guard against a malformed range; a node always covers its first line
    if (definition.end.row < definition.start.row) {
        return 1;
    }
    return definition.end.row - definition.start.row + 1;
}

size_t parameter_count(const Node &definition) {
    for (const auto& child : definition.children) {
        if (child.kind == NodeKind::Parameters) {
            return static_cast<size_t>(std::count_if(
                child.children.begin(), child.children.end(),
                [](const Node &param) { return is_counted_parameter(param.kind); }));
        }
    }
    return 0;
}

bool increases_nesting_level(NodeKind kind) {
    switch (kind) {
    case NodeKind::IfStatement:
    case NodeKind::ForStatement:
    case NodeKind::WhileStatement:
    case NodeKind::WithStatement:
    case NodeKind::TryStatement:
        return true;
    default:
        return false;
    }
}

size_t max_nesting_depth(const Node &definition, const NestingOptions &options) {
    size_t max_depth = 0;

    // Explicit work stack so deeply nested sources cannot exhaust the call stack
    std::stack<std::pair<const Node*, size_t>> nodes;
    for (const auto& child : definition.children) {
        nodes.push({&child, 0});
    }

    while (!nodes.empty()) {
        auto [current, parent_depth] = nodes.top();
        nodes.pop();

        if (options.isolate_nested_scopes && opens_scope(current->kind)) {
            continue;
        }

        size_t depth = parent_depth;
        if (increases_nesting_level(current->kind)) {
            ++depth;
        }
        max_depth = std::max(max_depth, depth);

        for (const auto& child : current->children) {
            nodes.push({&child, depth});
        }
    }

    spdlog::debug("Nesting depth {} for definition at line {}", max_depth, definition.start.row + 1);
    return max_depth;
}

} // namespace smellscan::metrics
