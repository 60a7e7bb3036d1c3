#pragma once

#include <cstdint>
#include <cstdio>
#include <ostream>
#include <string>

namespace cosmic {
namespace core {

/**
 * @brief UTF-8路径处理类，封装文件路径操作
 *
 * 路径以 UTF-8 字符串保存，构造时使用 utf8cpp 校验编码。
 * 文件系统操作不抛异常，失败时返回 false / 空值并写调试日志。
 */
class Path {
private:
    std::string utf8_path_;

public:
    explicit Path(const std::string& path);
    explicit Path(const char* path);
    Path() = default;

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    // 路径分解
    /**
     * @brief 扩展名（含点号），小写，例如 ".json"
     */
    std::string extension() const;
    Path absolute() const;

    /**
     * @brief 在原路径后追加后缀，例如 "out.xlsx" + ".tmp"
     */
    Path withSuffix(const std::string& suffix) const;

    // 文件操作
    bool exists() const;
    bool isFile() const;
    uintmax_t fileSize() const;
    bool remove() const;

    /**
     * @brief 移动（重命名）到目标路径，目标存在时覆盖
     * @return 是否移动成功
     */
    bool moveTo(const Path& target) const;

    /**
     * @brief 读取整个文件内容
     * @param out 输出缓冲
     * @param error 失败时填入系统错误描述
     * @return 是否读取成功
     */
    bool readAll(std::string& out, std::string& error) const;

    FILE* openForRead(bool binary = true) const;

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }
    bool operator<(const Path& other) const { return utf8_path_ < other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

} // namespace core
} // namespace cosmic
