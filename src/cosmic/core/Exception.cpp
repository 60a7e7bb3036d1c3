/**
 * @file Exception.cpp
 * @brief CosmicExcel异常类实现
 */

#include "cosmic/core/Exception.hpp"

#include <fmt/format.h>

namespace cosmic {
namespace core {

CosmicException::CosmicException(const std::string& message,
                                 ErrorCode code,
                                 const char* file,
                                 int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string CosmicException::getErrorCodeString() const {
    return toName(error_code_);
}

std::string CosmicException::getDetailedMessage() const {
    std::string result = fmt::format("[{}] {}", getErrorCodeString(), what());

    if (file_ && line_ > 0) {
        result += fmt::format(" (at {}:{})", file_, line_);
    }

    if (!context_.empty()) {
        result += "\nContext:";
        for (const auto& ctx : context_) {
            result += "\n  - ";
            result += ctx;
        }
    }

    return result;
}

void CosmicException::addContext(const std::string& context) {
    context_.push_back(context);
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : CosmicException(message, code, file, line)
    , filename_(filename) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : CosmicException(parameter_name.empty() ? message
                                             : fmt::format("{} (parameter: {})", message, parameter_name),
                      ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// OperationException 实现
OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : CosmicException(operation.empty() ? message
                                        : fmt::format("{} (operation: {})", message, operation),
                      code, file, line)
    , operation_(operation) {
}

// ParseException 实现
ParseException::ParseException(const std::string& message,
                               std::size_t source_line,
                               const char* file, int line)
    : CosmicException(source_line == 0 ? message
                                        : fmt::format("{} (line {})", message, source_line),
                      ErrorCode::ConfigParseError, file, line)
    , source_line_(source_line) {
}

// ConfigException 实现
ConfigException::ConfigException(const std::string& message,
                                 const std::string& field,
                                 const char* file, int line)
    : CosmicException(message, ErrorCode::InvalidConfig, file, line)
    , field_(field) {
}

// ArchiveException 实现
ArchiveException::ArchiveException(const std::string& message,
                                   const std::string& archive_path,
                                   ErrorCode code, const char* file, int line)
    : CosmicException(fmt::format("{} (archive: {})", message, archive_path), code, file, line)
    , archive_path_(archive_path) {
}

} // namespace core
} // namespace cosmic
