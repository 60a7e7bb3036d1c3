#include "cosmic/config/MeasurementLoader.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/parser/ParserProvider.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

#include <fmt/format.h>

namespace cosmic {
namespace config {

parser::Value loadDocument(const core::Path& path, const core::ParserOptions& options) {
    if (!path.exists()) {
        COSMIC_THROW(core::FileException,
                     fmt::format("Configuration file '{}' does not exist.", path.string()),
                     path.string(), core::ErrorCode::FileNotFound);
    }

    if (!path.isFile()) {
        COSMIC_THROW(core::FileException,
                     fmt::format("Configuration path '{}' is not a regular file.", path.string()),
                     path.string(), core::ErrorCode::FileReadError);
    }

    std::string text;
    std::string error;
    if (!path.readAll(text, error)) {
        COSMIC_THROW(core::FileException,
                     fmt::format("Failed to read configuration file '{}': {}", path.string(), error),
                     path.string(), core::ErrorCode::FileReadError);
    }
    CONFIG_DEBUG("Read {} bytes from {}", text.size(), path.string());

    parser::ParserProvider provider(options);
    const parser::IDocumentParser& parser = provider.select(path);
    const char* format = path.extension() == ".json" ? "JSON" : "YAML";

    try {
        return parser.parse(text);
    } catch (const core::CosmicException& e) {
        CONFIG_ERROR("{} parser failed on {}: {}", parser.name(), path.string(), e.what());
        core::ParseException wrapped(
            fmt::format("Failed to parse {} configuration file '{}': {}", format, path.string(), e.what()),
            0, __FILE__, __LINE__);
        wrapped.addContext(fmt::format("parser: {}", parser.name()));
        throw wrapped;
    }
}

model::SystemMeasurement loadMeasurement(const core::Path& path, const core::ParserOptions& options) {
    parser::Value document = loadDocument(path, options);

    if (!document.isMapping()) {
        COSMIC_THROW(core::ConfigException,
                     "Measurement configuration must define a mapping with 'system' and 'functional_processes' keys.",
                     "root");
    }

    model::SystemMeasurement measurement = model::SystemMeasurement::fromValue(document);
    CONFIG_INFO("Loaded '{}' from {}: {} functional processes, {} CFP",
                measurement.name, path.string(), measurement.functional_processes.size(), measurement.totalCfp());
    return measurement;
}

}} // namespace cosmic::config
