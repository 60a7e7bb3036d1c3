#include "cosmic/parser/YamlCppParser.hpp"
#include "cosmic/parser/ScalarParser.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

#include <string>
#include <yaml-cpp/yaml.h>

namespace cosmic {
namespace parser {

Value YamlCppParser::parse(std::string_view text) const {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        // mark.line 为 0 起始
        size_t line = e.mark.is_null() ? 0 : static_cast<size_t>(e.mark.line) + 1;
        COSMIC_THROW(core::ParseException, e.msg, line);
    }

    if (!root.IsDefined() || root.IsNull()) {
        PARSER_DEBUG("yaml-cpp returned empty document, using empty mapping");
        return Value(Mapping());
    }
    return convert(root);
}

Value YamlCppParser::convert(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return Value();

    case YAML::NodeType::Scalar: {
        const std::string& scalar = node.Scalar();
        // 引号标量的 tag 为 "!"
        if (node.Tag() == "!") {
            return Value(scalar);
        }
        if (scalar == "~") {
            return Value();
        }
        return ScalarParser::parse(scalar);
    }

    case YAML::NodeType::Sequence: {
        List list;
        list.reserve(node.size());
        for (const auto& child : node) {
            list.push_back(convert(child));
        }
        return Value(std::move(list));
    }

    case YAML::NodeType::Map: {
        Mapping mapping;
        for (const auto& entry : node) {
            if (!entry.first.IsScalar()) {
                size_t line = static_cast<size_t>(entry.first.Mark().line) + 1;
                COSMIC_THROW(core::ParseException, "Mapping keys must be scalars", line);
            }
            mapping.set(entry.first.Scalar(), convert(entry.second));
        }
        return Value(std::move(mapping));
    }
    }

    return Value();
}

}} // namespace cosmic::parser
