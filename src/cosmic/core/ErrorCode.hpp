#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace cosmic {
namespace core {

/**
 * @brief CosmicExcel统一错误码
 *
 * 按区段分组，异常和 Error 结构共用同一套编码
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileWriteError = 22,
    FileReadError = 23,

    // 配置与解析错误 (40-59)
    ConfigParseError = 40,
    InvalidConfig = 41,
    UnsupportedValue = 42,

    // 工作簿/归档错误 (60-79)
    InvalidWorkbook = 60,
    InvalidWorksheet = 61,
    ZipError = 62,
    XmlWriteError = 63
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    explicit operator bool() const noexcept { return isError(); }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转可读描述
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码转枚举名（用于日志和详细消息）
 */
const char* toName(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

inline Error success() {
    return Error(ErrorCode::Ok);
}

}} // namespace cosmic::core
