#include "parser_registry.hpp"
#include "parser/languages/python_parser.hpp"
#include <filesystem>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

namespace smellscan::parser {

const ParserRegistry& ParserRegistry::builtin() {
    static const ParserRegistry registry = [] {
        ParserRegistry grammars;
        grammars.add(std::make_unique<languages::PythonParser>());
        return grammars;
    }();
    return registry;
}

void ParserRegistry::add(std::unique_ptr<ParserBase> prototype) {
    if (!prototype) {
        throw std::invalid_argument("Cannot register a null parser");
    }

    auto language = prototype->get_language_name();
    if (!prototype->initialize()) {
        spdlog::error("Grammar for {} could not be loaded; its files will be reported as unsupported", language);
        return;
    }

    for (auto& extension : prototype->get_extensions()) {
        language_by_extension_[std::move(extension)] = language;
    }
    spdlog::debug("Registered {} grammar", language);
    prototypes_[std::move(language)] = std::move(prototype);
}

tree::SyntaxTree ParserRegistry::parse(const ParserContext &context, std::string_view language) const {
    auto it = prototypes_.find(language);
    if (it == prototypes_.end()) {
        throw ParseError("Unsupported language: " + std::string(language));
    }

    auto parser = it->second->clone();
    if (!parser) {
        throw ParseError("Could not create a " + std::string(language) + " parser for " + context.file_path);
    }
    return parser->parse(context);
}

std::optional<std::string> ParserRegistry::language_for_file(const std::string &file_path) const {
    auto extension = std::filesystem::path(file_path).extension().string();
    if (extension.size() < 2) {
        return std::nullopt;
    }

    auto it = language_by_extension_.find(std::string_view(extension).substr(1));
    if (it == language_by_extension_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ParserRegistry::supports(std::string_view language) const {
    return prototypes_.find(language) != prototypes_.end();
}

std::vector<std::string> ParserRegistry::languages() const {
    std::vector<std::string> names;
    for (const auto& entry : prototypes_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> ParserRegistry::extensions() const {
    std::vector<std::string> names;
    for (const auto& entry : language_by_extension_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace smellscan::parser
