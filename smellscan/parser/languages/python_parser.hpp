#ifndef SMELLSCAN_PARSER_PYTHON_PARSER_HPP
#define SMELLSCAN_PARSER_PYTHON_PARSER_HPP

#pragma once

#include "parser/parser_base.hpp"
#include <string>
#include <vector>
#include <memory>

extern "C" {
    const TSLanguage* tree_sitter_python();
}

namespace smellscan::parser::languages {

class PythonParser : public ParserBase {
public:
    PythonParser() = default;

    PythonParser(const PythonParser&) = delete;
    PythonParser& operator=(const PythonParser&) = delete;
    PythonParser(PythonParser&&) = default;
    PythonParser& operator=(PythonParser&&) = default;

    ~PythonParser() override = default;

    std::unique_ptr<ParserBase> clone() const override;
    bool initialize() override;
    std::vector<std::string> get_extensions() const override;
    std::string get_language_name() const override;
    tree::NodeKind kind_for(std::string_view type) const override;
};

} // namespace smellscan::parser::languages

#endif // SMELLSCAN_PARSER_PYTHON_PARSER_HPP
