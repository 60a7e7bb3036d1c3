#include "cosmic/parser/Value.hpp"
#include "cosmic/core/Exception.hpp"

#include <cmath>
#include <fmt/format.h>

namespace cosmic {
namespace parser {

// ========== Mapping ==========

void Mapping::set(std::string key, Value value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

bool Mapping::contains(const std::string& key) const {
    return find(key) != nullptr;
}

const Value* Mapping::find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

Value* Mapping::find(const std::string& key) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

const Value& Mapping::at(const std::string& key) const {
    const Value* value = find(key);
    if (!value) {
        COSMIC_THROW(core::ParameterException, fmt::format("Key '{}' not found in mapping", key), "key");
    }
    return *value;
}

void Mapping::merge(Mapping&& other) {
    for (auto& entry : other.entries_) {
        set(std::move(entry.first), std::move(entry.second));
    }
    other.entries_.clear();
}

bool Mapping::operator==(const Mapping& other) const {
    return entries_ == other.entries_;
}

// ========== Value ==========

namespace {

[[noreturn]] void throwTypeMismatch(Value::Type expected, Value::Type actual) {
    COSMIC_THROW(core::OperationException,
                 fmt::format("Value is {}, expected {}", Value::typeName(actual), Value::typeName(expected)),
                 "Value access", core::ErrorCode::InvalidArgument);
}

std::string formatFloat(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    std::string s = fmt::format("{}", v);
    // 整数值的浮点数保留 ".0"，与整数区分
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}

void dumpTo(const Value& value, std::string& out) {
    switch (value.type()) {
    case Value::Type::Null:
        out += "null";
        break;
    case Value::Type::Boolean:
        out += value.asBool() ? "true" : "false";
        break;
    case Value::Type::Integer:
        out += fmt::format("{}", value.asInteger());
        break;
    case Value::Type::Float:
        out += formatFloat(value.asFloat());
        break;
    case Value::Type::String:
        out += '"';
        for (char c : value.asString()) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
        break;
    case Value::Type::List: {
        out += '[';
        bool first = true;
        for (const auto& item : value.asList()) {
            if (!first) out += ", ";
            first = false;
            dumpTo(item, out);
        }
        out += ']';
        break;
    }
    case Value::Type::Mapping: {
        out += '{';
        bool first = true;
        for (const auto& entry : value.asMapping()) {
            if (!first) out += ", ";
            first = false;
            out += entry.first;
            out += ": ";
            dumpTo(entry.second, out);
        }
        out += '}';
        break;
    }
    }
}

} // namespace

const char* Value::typeName(Type type) {
    switch (type) {
        case Type::Null:    return "null";
        case Type::Boolean: return "boolean";
        case Type::Integer: return "integer";
        case Type::Float:   return "float";
        case Type::String:  return "string";
        case Type::List:    return "list";
        case Type::Mapping: return "mapping";
    }
    return "unknown";
}

bool Value::asBool() const {
    if (!isBool()) throwTypeMismatch(Type::Boolean, type());
    return std::get<bool>(data_);
}

int64_t Value::asInteger() const {
    if (!isInteger()) throwTypeMismatch(Type::Integer, type());
    return std::get<int64_t>(data_);
}

double Value::asFloat() const {
    if (isInteger()) return static_cast<double>(std::get<int64_t>(data_));
    if (!isFloat()) throwTypeMismatch(Type::Float, type());
    return std::get<double>(data_);
}

const std::string& Value::asString() const {
    if (!isString()) throwTypeMismatch(Type::String, type());
    return std::get<std::string>(data_);
}

const List& Value::asList() const {
    if (!isList()) throwTypeMismatch(Type::List, type());
    return std::get<List>(data_);
}

List& Value::asList() {
    if (!isList()) throwTypeMismatch(Type::List, type());
    return std::get<List>(data_);
}

const Mapping& Value::asMapping() const {
    if (!isMapping()) throwTypeMismatch(Type::Mapping, type());
    return std::get<Mapping>(data_);
}

Mapping& Value::asMapping() {
    if (!isMapping()) throwTypeMismatch(Type::Mapping, type());
    return std::get<Mapping>(data_);
}

std::string Value::toScalarString() const {
    switch (type()) {
    case Type::Null:
        return "";
    case Type::Boolean:
        return asBool() ? "True" : "False";
    case Type::Integer:
        return fmt::format("{}", asInteger());
    case Type::Float:
        return formatFloat(asFloat());
    case Type::String:
        return asString();
    default:
        COSMIC_THROW(core::OperationException,
                     fmt::format("Cannot render {} as scalar text", typeName(type())),
                     "toScalarString", core::ErrorCode::InvalidArgument);
    }
}

std::string Value::dump() const {
    std::string out;
    dumpTo(*this, out);
    return out;
}

}} // namespace cosmic::parser
