#ifndef SMELLSCAN_PARSER_REGISTRY_HPP
#define SMELLSCAN_PARSER_REGISTRY_HPP

#pragma once

#include "parser_base.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace smellscan::parser {

// Grammars available to the tree adapter, by language name and file
// extension. Every parse gets a fresh parser cloned from the prototype.
class ParserRegistry {
public:
    // Python, set up on first use
    static const ParserRegistry& builtin();

    // Initializes the prototype; a grammar that fails to load is logged and
    // left out. Throws std::invalid_argument on null.
    void add(std::unique_ptr<ParserBase> prototype);

    // Syntax tree for the context in the given language. Throws ParseError,
    // including for a language nobody registered.
    tree::SyntaxTree parse(const ParserContext &context, std::string_view language) const;

    std::optional<std::string> language_for_file(const std::string &file_path) const;
    bool supports(std::string_view language) const;

    std::vector<std::string> languages() const;
    std::vector<std::string> extensions() const;

private:
    std::map<std::string, std::unique_ptr<ParserBase>, std::less<>> prototypes_;
    std::map<std::string, std::string, std::less<>> language_by_extension_;
};

} // namespace smellscan::parser

#endif // SMELLSCAN_PARSER_REGISTRY_HPP
