#include "cosmic/parser/ParserProvider.hpp"
#include "cosmic/parser/SimpleYamlParser.hpp"
#include "cosmic/parser/YamlCppParser.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

namespace cosmic {
namespace parser {

ParserProvider::ParserProvider(core::ParserOptions options)
    : options_(options)
    , builtin_(create(core::ParserBackend::Builtin, options))
    , yaml_cpp_(create(core::ParserBackend::YamlCpp, options)) {
}

core::ParserBackend ParserProvider::resolve(core::ParserBackend requested, const core::Path& source) {
    if (source.extension() == ".json") {
        return core::ParserBackend::YamlCpp;
    }
    if (requested == core::ParserBackend::Auto) {
        return core::ParserBackend::Builtin;
    }
    return requested;
}

std::unique_ptr<IDocumentParser> ParserProvider::create(core::ParserBackend backend,
                                                        const core::ParserOptions& options) {
    switch (backend) {
    case core::ParserBackend::YamlCpp:
        return std::make_unique<YamlCppParser>();
    case core::ParserBackend::Auto:
    case core::ParserBackend::Builtin:
    default:
        return std::make_unique<SimpleYamlParser>(options);
    }
}

const IDocumentParser& ParserProvider::select(const core::Path& source) const {
    core::ParserBackend backend = resolve(options_.backend, source);
    const IDocumentParser& parser = backend == core::ParserBackend::YamlCpp ? *yaml_cpp_ : *builtin_;
    PARSER_DEBUG("Selected '{}' parser for {}", parser.name(), source.string());
    return parser;
}

bool ParserProvider::parseBackendName(const std::string& name, core::ParserBackend& out) {
    if (name == "auto") {
        out = core::ParserBackend::Auto;
    } else if (name == "builtin" || name == "simple") {
        out = core::ParserBackend::Builtin;
    } else if (name == "yaml-cpp" || name == "yaml") {
        out = core::ParserBackend::YamlCpp;
    } else {
        return false;
    }
    return true;
}

}} // namespace cosmic::parser
