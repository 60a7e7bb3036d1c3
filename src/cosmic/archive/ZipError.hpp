#pragma once

namespace cosmic {
namespace archive {

/**
 * @brief ZIP 操作错误码
 */
enum class ZipError {
    Ok = 0,
    NotOpen,           // 归档未打开
    IoFail,            // 读写失败
    BadFormat,         // 归档格式损坏
    FileNotFound,      // 条目不存在
    DuplicateEntry,    // 条目已写入
    InvalidParameter,  // 参数无效
    CompressionFail,   // 压缩失败
    InternalError      // 内部错误
};

inline bool operator!(ZipError err) {
    return err != ZipError::Ok;
}

inline bool isSuccess(ZipError err) {
    return err == ZipError::Ok;
}

inline bool isError(ZipError err) {
    return err != ZipError::Ok;
}

inline const char* toString(ZipError err) {
    switch (err) {
    case ZipError::Ok:               return "ok";
    case ZipError::NotOpen:          return "archive not open";
    case ZipError::IoFail:           return "i/o failure";
    case ZipError::BadFormat:        return "bad archive format";
    case ZipError::FileNotFound:     return "entry not found";
    case ZipError::DuplicateEntry:   return "duplicate entry";
    case ZipError::InvalidParameter: return "invalid parameter";
    case ZipError::CompressionFail:  return "compression failure";
    case ZipError::InternalError:    return "internal error";
    }
    return "unknown";
}

}} // namespace cosmic::archive
