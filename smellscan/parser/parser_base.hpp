#ifndef SMELLSCAN_PARSER_BASE_HPP
#define SMELLSCAN_PARSER_BASE_HPP

#pragma once

#include "tree/syntax_node.hpp"
#include <string>
#include <string_view>
#include <memory>
#include <stdexcept>
#include <vector>
#include <tree_sitter/api.h>
#include <spdlog/spdlog.h>

namespace smellscan::parser {

// The source unit could not be turned into a syntax tree
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ParserContext {
    std::string file_content;
    std::string file_path;
};

class ParserBase {
public:
    // Non-copyable but movable
    ParserBase() : parser_(ts_parser_new(), ts_parser_delete) {}
    ParserBase(const ParserBase&) = delete;
    ParserBase& operator=(const ParserBase&) = delete;
    ParserBase(ParserBase&&) = default;
    ParserBase& operator=(ParserBase&&) = default;
    virtual ~ParserBase() = default;

    // Create a clone of this parser
    virtual std::unique_ptr<ParserBase> clone() const = 0;

    virtual bool initialize() = 0;
    virtual std::vector<std::string> get_extensions() const = 0;
    virtual std::string get_language_name() const = 0;

    // Grammar tag to node kind
    virtual tree::NodeKind kind_for(std::string_view type) const = 0;

    // Parse and convert into an owned tree. Throws ParseError.
    tree::SyntaxTree parse(const ParserContext &context);

protected:
    std::string extract_node_text(const TSNode &node, const std::string &source_code) const;
    tree::Node convert_node(const TSNode &node, const std::string &source_code) const;

    std::unique_ptr<TSParser, void(*)(TSParser*)> parser_;
};

} // namespace smellscan::parser

#endif // SMELLSCAN_PARSER_BASE_HPP
