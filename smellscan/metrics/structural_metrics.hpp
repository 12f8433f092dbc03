#ifndef SMELLSCAN_METRICS_STRUCTURAL_METRICS_HPP
#define SMELLSCAN_METRICS_STRUCTURAL_METRICS_HPP

#pragma once

#include "tree/syntax_node.hpp"
#include <cstddef>

namespace smellscan::metrics {

struct NestingOptions {
    // When set, nested function and class bodies do not count toward the
    // enclosing definition's depth. They are still measured on their own.
    bool isolate_nested_scopes{false};
};

// end_line - start_line + 1, blank lines and comments included
size_t line_span(const tree::Node &definition);

// Plain, typed and defaulted entries of the parameter list. Splats and
// other grammar markers are not counted. 0 when there is no list.
size_t parameter_count(const tree::Node &definition);

// Deepest stack of if/for/while/with/try statements below the definition
size_t max_nesting_depth(const tree::Node &definition, const NestingOptions &options = {});

bool increases_nesting_level(tree::NodeKind kind);

} // namespace smellscan::metrics

#endif // SMELLSCAN_METRICS_STRUCTURAL_METRICS_HPP
