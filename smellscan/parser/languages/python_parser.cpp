#include "python_parser.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace smellscan::parser::languages {

std::unique_ptr<ParserBase> PythonParser::clone() const {
    auto parser = std::make_unique<PythonParser>();
    if (!parser->initialize()) {
        return nullptr;
    }
    return parser;
}

bool PythonParser::initialize() {
    if (!parser_) {
        spdlog::error("Parser not initialized");
        return false;
    }

    spdlog::debug("Setting up Python parser with tree-sitter");
    if (!ts_parser_set_language(parser_.get(), tree_sitter_python())) {
        spdlog::error("tree-sitter-python grammar is incompatible with the tree-sitter runtime");
        return false;
    }
    return true;
}

std::vector<std::string> PythonParser::get_extensions() const {
    return {"py"};
}

std::string PythonParser::get_language_name() const {
    return "python";
}

tree::NodeKind PythonParser::kind_for(std::string_view type) const {
    using tree::NodeKind;

    static const std::unordered_map<std::string_view, NodeKind> kinds = {
        {"module", NodeKind::Module},
        {"function_definition", NodeKind::FunctionDefinition},
        {"class_definition", NodeKind::ClassDefinition},
        {"decorated_definition", NodeKind::DecoratedDefinition},
        {"block", NodeKind::Block},
        {"identifier", NodeKind::Identifier},
        {"parameters", NodeKind::Parameters},
        {"typed_parameter", NodeKind::TypedParameter},
        {"default_parameter", NodeKind::DefaultParameter},
        {"typed_default_parameter", NodeKind::TypedDefaultParameter},
        {"list_splat_pattern", NodeKind::ListSplatPattern},
        {"dictionary_splat_pattern", NodeKind::DictionarySplatPattern},
        {"if_statement", NodeKind::IfStatement},
        {"for_statement", NodeKind::ForStatement},
        {"while_statement", NodeKind::WhileStatement},
        {"with_statement", NodeKind::WithStatement},
        {"try_statement", NodeKind::TryStatement},
        {"call", NodeKind::Call},
        {"attribute", NodeKind::Attribute},
        {"ERROR", NodeKind::Error}
    };

    auto it = kinds.find(type);
    return it != kinds.end() ? it->second : NodeKind::Other;
}

} // namespace smellscan::parser::languages
