#include "cosmic/model/Measurement.hpp"
#include "cosmic/core/Exception.hpp"
#include "cosmic/parser/ScalarParser.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace cosmic {
namespace model {

namespace {

std::string upperTrimmed(const std::string& value) {
    std::string text(parser::ScalarParser::trim(value));
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

const parser::Mapping& requireMapping(const parser::Value& value, const char* what) {
    if (!value.isMapping()) {
        COSMIC_THROW(core::ConfigException,
                     fmt::format("{} definition must be a mapping, got {}.", what, parser::Value::typeName(value.type())),
                     what);
    }
    return value.asMapping();
}

// 缺失或为 null 时返回空列表
const parser::List* optionalList(const parser::Mapping& mapping, std::initializer_list<const char*> aliases) {
    for (const char* key : aliases) {
        const parser::Value* item = mapping.find(key);
        if (!item || item->isNull()) continue;
        if (item->isList()) {
            if (item->asList().empty()) continue;
            return &item->asList();
        }
        COSMIC_THROW(core::ConfigException, fmt::format("Field '{}' must be a list.", key), key);
    }
    return nullptr;
}

} // namespace

DataMovementType dataMovementTypeFromString(const std::string& value) {
    const std::string normalized = upperTrimmed(value);
    if (normalized == "E" || normalized == "ENTRY") return DataMovementType::Entry;
    if (normalized == "X" || normalized == "EXIT") return DataMovementType::Exit;
    if (normalized == "R" || normalized == "READ") return DataMovementType::Read;
    if (normalized == "W" || normalized == "WRITE") return DataMovementType::Write;

    COSMIC_THROW(core::ConfigException,
                 fmt::format("Unsupported data movement type '{}'. Expected one of: E, X, R, W.", value),
                 "type");
}

const char* toString(DataMovementType type) {
    switch (type) {
    case DataMovementType::Entry: return "E";
    case DataMovementType::Exit:  return "X";
    case DataMovementType::Read:  return "R";
    case DataMovementType::Write: return "W";
    }
    return "?";
}

namespace detail {

std::optional<std::string> firstScalar(const parser::Mapping& mapping,
                                       std::initializer_list<const char*> aliases) {
    for (const char* key : aliases) {
        const parser::Value* item = mapping.find(key);
        if (!item || item->isNull()) continue;
        if (!item->isScalar()) {
            COSMIC_THROW(core::ConfigException,
                         fmt::format("Field '{}' must be a scalar value, got {}.", key,
                                     parser::Value::typeName(item->type())),
                         key);
        }
        std::string text = item->toScalarString();
        if (text.empty()) continue;
        return text;
    }
    return std::nullopt;
}

std::vector<std::string> scalarList(const parser::Mapping& mapping,
                                    std::initializer_list<const char*> aliases) {
    std::vector<std::string> result;
    for (const char* key : aliases) {
        const parser::Value* item = mapping.find(key);
        if (!item || item->isNull()) continue;

        if (item->isScalar()) {
            result.push_back(item->toScalarString());
            return result;
        }
        if (item->isMapping()) {
            COSMIC_THROW(core::ConfigException, fmt::format("Field '{}' must be a list.", key), key);
        }
        if (item->asList().empty()) continue;

        for (const auto& element : item->asList()) {
            if (!element.isScalar()) {
                COSMIC_THROW(core::ConfigException,
                             fmt::format("Entries of '{}' must be scalar values.", key), key);
            }
            result.push_back(element.toScalarString());
        }
        return result;
    }
    return result;
}

} // namespace detail

DataMovement DataMovement::fromValue(const parser::Value& value) {
    const parser::Mapping& payload = requireMapping(value, "Data movement");

    if (!payload.contains("type")) {
        COSMIC_THROW(core::ConfigException, "Data movement definition must include a 'type' field.", "type");
    }
    if (!payload.contains("description")) {
        COSMIC_THROW(core::ConfigException, "Data movement definition must include a 'description' field.",
                     "description");
    }

    const parser::Value& type_value = payload.at("type");
    const parser::Value& description_value = payload.at("description");
    if (!type_value.isScalar()) {
        COSMIC_THROW(core::ConfigException, "Data movement 'type' must be a scalar value.", "type");
    }
    if (!description_value.isScalar()) {
        COSMIC_THROW(core::ConfigException, "Data movement 'description' must be a scalar value.", "description");
    }

    DataMovement movement;
    movement.type = dataMovementTypeFromString(type_value.toScalarString());
    movement.description = std::string(parser::ScalarParser::trim(description_value.toScalarString()));
    movement.object_of_interest = detail::firstScalar(payload, {"object_of_interest", "ooi"});
    movement.trigger = detail::firstScalar(payload, {"trigger"});
    movement.code_reference = detail::firstScalar(payload, {"code_reference"});
    movement.notes = detail::firstScalar(payload, {"notes", "additional_notes"});
    return movement;
}

FunctionalProcess FunctionalProcess::fromValue(const parser::Value& value) {
    const parser::Mapping& payload = requireMapping(value, "Functional process");

    if (!payload.contains("name")) {
        COSMIC_THROW(core::ConfigException, "Functional process definition must include a 'name' field.", "name");
    }
    const parser::Value& name_value = payload.at("name");
    if (!name_value.isScalar()) {
        COSMIC_THROW(core::ConfigException, "Functional process 'name' must be a scalar value.", "name");
    }

    FunctionalProcess process;
    process.name = std::string(parser::ScalarParser::trim(name_value.toScalarString()));
    process.description = detail::firstScalar(payload, {"description", "purpose"});
    process.trigger = detail::firstScalar(payload, {"trigger"});
    process.object_of_interest = detail::firstScalar(payload, {"object_of_interest", "ooi"});

    if (const parser::List* movements = optionalList(payload, {"data_movements"})) {
        process.data_movements.reserve(movements->size());
        for (const auto& item : *movements) {
            process.data_movements.push_back(DataMovement::fromValue(item));
        }
    }

    MODEL_DEBUG("Functional process '{}' with {} data movements", process.name, process.data_movements.size());
    return process;
}

size_t FunctionalProcess::countMovements(DataMovementType type) const {
    return static_cast<size_t>(std::count_if(data_movements.begin(), data_movements.end(),
                                             [type](const DataMovement& m) { return m.type == type; }));
}

SystemMeasurement SystemMeasurement::fromValue(const parser::Value& root) {
    if (!root.isMapping()) {
        COSMIC_THROW(core::ConfigException,
                     "Measurement configuration must define a mapping with 'system' and 'functional_processes' keys.",
                     "root");
    }
    const parser::Mapping& payload = root.asMapping();

    SystemMeasurement measurement;

    const parser::Value* system = payload.find("system");
    if (system && !system->isNull()) {
        const parser::Mapping& info = requireMapping(*system, "System");
        if (auto name = detail::firstScalar(info, {"name"})) {
            measurement.name = *name;
        }
        measurement.boundary = detail::firstScalar(info, {"boundary"});
        measurement.description = detail::firstScalar(info, {"description"});
        measurement.persistence_resources = detail::scalarList(info, {"persistence_resources"});
        measurement.external_actors = detail::scalarList(info, {"external_actors"});
    } else {
        MODEL_WARN("No 'system' section, using default name '{}'", DEFAULT_NAME);
    }

    measurement.objects_of_interest = detail::scalarList(payload, {"objects", "objects_of_interest"});

    if (const parser::List* processes = optionalList(payload, {"functional_processes"})) {
        measurement.functional_processes.reserve(processes->size());
        for (const auto& item : *processes) {
            measurement.functional_processes.push_back(FunctionalProcess::fromValue(item));
        }
    }

    MODEL_INFO("Loaded measurement '{}' with {} functional processes",
               measurement.name, measurement.functional_processes.size());
    return measurement;
}

size_t SystemMeasurement::totalCfp() const {
    size_t total = 0;
    for (const auto& process : functional_processes) {
        total += process.totalCfp();
    }
    return total;
}

}} // namespace cosmic::model
