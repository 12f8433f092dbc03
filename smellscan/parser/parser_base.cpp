#include "parser/parser_base.hpp"
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace smellscan::parser {

namespace {

// tree-sitter addresses source bytes with 32-bit offsets
uint32_t source_length(const ParserContext &context) {
    if (context.file_content.length() > std::numeric_limits<uint32_t>::max()) {
        throw ParseError("File too large to parse: " + context.file_path);
    }
    return static_cast<uint32_t>(context.file_content.length());
}

} // namespace

tree::SyntaxTree ParserBase::parse(const ParserContext &context) {
    if (!parser_ || !ts_parser_language(parser_.get())) {
        throw ParseError("Parser for " + get_language_name() + " is not initialized");
    }

    spdlog::debug("Parsing file: {}", context.file_path);

    std::unique_ptr<TSTree, void(*)(TSTree*)> ts_tree(
        ts_parser_parse_string(
            parser_.get(),
            nullptr,
            context.file_content.c_str(),
            source_length(context)),
        ts_tree_delete);

    if (!ts_tree) {
        throw ParseError("Failed to parse file: " + context.file_path);
    }

    TSNode root_node = ts_tree_root_node(ts_tree.get());
    spdlog::debug("Root node type: {}", ts_node_type(root_node));

    if (ts_node_has_error(root_node)) {
        spdlog::warn("Syntax errors in {}; malformed regions will be skipped", context.file_path);
    }

    tree::SyntaxTree result;
    result.root = convert_node(root_node, context.file_content);
    result.file_path = context.file_path;
    result.source = context.file_content;
    return result;
}

std::string ParserBase::extract_node_text(const TSNode &node, const std::string &source_code) const {
    uint32_t start_byte = ts_node_start_byte(node);
    uint32_t end_byte = ts_node_end_byte(node);

    if (start_byte > end_byte || end_byte > source_code.length()) {
        return "";
    }

    return source_code.substr(start_byte, end_byte - start_byte);
}

tree::Node ParserBase::convert_node(const TSNode &root, const std::string &source_code) const {
    tree::Node converted;

    // Generated code can nest far deeper than the call stack allows, so the
    // copy is built level by level. Each children vector is sized once before
    // its elements are queued, which keeps the queued pointers valid.
    std::vector<std::pair<TSNode, tree::Node*>> pending;
    pending.emplace_back(root, &converted);

    while (!pending.empty()) {
        auto [node, target] = pending.back();
        pending.pop_back();

        target->type = ts_node_type(node);
        target->kind = kind_for(target->type);

        TSPoint start = ts_node_start_point(node);
        TSPoint end = ts_node_end_point(node);
        target->start = {start.row, start.column};
        target->end = {end.row, end.column};

        uint32_t child_count = ts_node_child_count(node);
        if (child_count == 0) {
            target->text = extract_node_text(node, source_code);
            continue;
        }

        target->children.resize(child_count);
        for (uint32_t i = child_count; i > 0; --i) {
            pending.emplace_back(ts_node_child(node, i - 1), &target->children[i - 1]);
        }
    }

    return converted;
}

} // namespace smellscan::parser
