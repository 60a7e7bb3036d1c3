/**
 * @file Exception.hpp
 * @brief CosmicExcel异常类定义
 */

#ifndef COSMIC_EXCEPTION_HPP
#define COSMIC_EXCEPTION_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace cosmic {
namespace core {

/**
 * @brief CosmicExcel基础异常类
 */
class CosmicException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    CosmicException(const std::string& message,
                    ErrorCode code = ErrorCode::InternalError,
                    const char* file = nullptr,
                    int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息（错误码、源码位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public CosmicException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public CosmicException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常（对象状态不允许该操作）
 */
class OperationException : public CosmicException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief 结构化文本解析异常
 *
 * source_line 为 1 起始的源文件行号，0 表示未知
 */
class ParseException : public CosmicException {
public:
    ParseException(const std::string& message,
                   std::size_t source_line = 0,
                   const char* file = nullptr, int line = 0);

    std::size_t getSourceLine() const { return source_line_; }

private:
    std::size_t source_line_;
};

/**
 * @brief 配置校验异常（缺少必填字段、非法取值等）
 */
class ConfigException : public CosmicException {
public:
    ConfigException(const std::string& message,
                    const std::string& field = "",
                    const char* file = nullptr, int line = 0);

    const std::string& getField() const { return field_; }

private:
    std::string field_;
};

/**
 * @brief 归档写出异常
 */
class ArchiveException : public CosmicException {
public:
    ArchiveException(const std::string& message,
                     const std::string& archive_path,
                     ErrorCode code = ErrorCode::ZipError,
                     const char* file = nullptr, int line = 0);

    const std::string& getArchivePath() const { return archive_path_; }

private:
    std::string archive_path_;
};

} // namespace core
} // namespace cosmic

// 便捷宏定义：附加参数位于消息之后、源码位置之前
#define COSMIC_THROW(ExceptionType, message, ...) \
    throw ExceptionType((message), ##__VA_ARGS__, __FILE__, __LINE__)

#endif // COSMIC_EXCEPTION_HPP
