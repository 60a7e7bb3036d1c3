#include "cosmic/core/ErrorCode.hpp"

namespace cosmic {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:               return "Success";

        // 通用错误 (1-19)
        case ErrorCode::InvalidArgument:  return "Invalid argument";
        case ErrorCode::InternalError:    return "Internal error";

        // 文件操作错误 (20-39)
        case ErrorCode::FileNotFound:     return "File not found";
        case ErrorCode::FileAccessDenied: return "File access denied";
        case ErrorCode::FileWriteError:   return "File write error";
        case ErrorCode::FileReadError:    return "File read error";

        // 配置与解析错误 (40-59)
        case ErrorCode::ConfigParseError: return "Configuration parse error";
        case ErrorCode::InvalidConfig:    return "Invalid configuration";
        case ErrorCode::UnsupportedValue: return "Unsupported value";

        // 工作簿/归档错误 (60-79)
        case ErrorCode::InvalidWorkbook:  return "Invalid workbook";
        case ErrorCode::InvalidWorksheet: return "Invalid worksheet";
        case ErrorCode::ZipError:         return "ZIP error";
        case ErrorCode::XmlWriteError:    return "XML write error";

        default:                          return "Unknown error";
    }
}

const char* toName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:               return "Ok";
        case ErrorCode::InvalidArgument:  return "InvalidArgument";
        case ErrorCode::InternalError:    return "InternalError";
        case ErrorCode::FileNotFound:     return "FileNotFound";
        case ErrorCode::FileAccessDenied: return "FileAccessDenied";
        case ErrorCode::FileWriteError:   return "FileWriteError";
        case ErrorCode::FileReadError:    return "FileReadError";
        case ErrorCode::ConfigParseError: return "ConfigParseError";
        case ErrorCode::InvalidConfig:    return "InvalidConfig";
        case ErrorCode::UnsupportedValue: return "UnsupportedValue";
        case ErrorCode::InvalidWorkbook:  return "InvalidWorkbook";
        case ErrorCode::InvalidWorksheet: return "InvalidWorksheet";
        case ErrorCode::ZipError:         return "ZipError";
        case ErrorCode::XmlWriteError:    return "XmlWriteError";
        default:                          return "Unknown";
    }
}

}} // namespace cosmic::core
