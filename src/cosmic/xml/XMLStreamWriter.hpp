/**
 * @file XMLStreamWriter.hpp
 * @brief 流式XML写入器
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cosmic {
namespace xml {

/**
 * @brief 流式XML写入器
 *
 * 支持两种输出模式：
 * - 内存缓冲：toString() 取回完整文档
 * - 回调：缓冲达到阈值时把数据块交给回调
 *
 * 属性在 startElement 之后、首个子节点之前累积，
 * 元素没有子节点时以 "/>" 自闭合。
 */
class XMLStreamWriter {
public:
    using WriteCallback = std::function<void(std::string_view chunk)>;

    enum class OutputMode {
        CALLBACK,       // 回调函数输出
        MEMORY_BUFFER   // 内存缓冲输出
    };

    static constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

    XMLStreamWriter();

    /**
     * @brief 回调输出构造函数
     * @param callback 输出回调函数
     * @param chunk_size 缓冲阈值
     * @throws ParameterException 回调为空
     */
    explicit XMLStreamWriter(WriteCallback callback, size_t chunk_size = DEFAULT_CHUNK_SIZE);

    ~XMLStreamWriter();

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    void startDocument();
    /**
     * @brief 关闭所有未关闭元素并刷新
     */
    void endDocument();

    void startElement(const std::string& name);
    void endElement();
    void writeEmptyElement(const std::string& name);

    void writeAttribute(const std::string& name, std::string_view value);
    void writeAttribute(const std::string& name, const char* value);
    void writeAttribute(const std::string& name, int64_t value);
    void writeAttribute(const std::string& name, int value);
    void writeAttribute(const std::string& name, size_t value);

    void writeText(std::string_view text);
    void writeRaw(std::string_view data);

    void flush();

    /**
     * @brief 获取输出结果（仅内存模式）
     */
    std::string toString() const;

    OutputMode getOutputMode() const { return output_mode_; }
    size_t getBytesWritten() const { return bytes_written_ + buffer_.size(); }
    size_t depth() const { return element_stack_.size(); }

private:
    struct XMLAttribute {
        std::string key;
        std::string value;

        XMLAttribute(std::string k, std::string v)
            : key(std::move(k)), value(std::move(v)) {}
    };

    void ensureElementClosed();
    void writeAttributesToBuffer();
    void requireOpenTag(const char* operation) const;
    void flushIfNeeded();

    OutputMode output_mode_ = OutputMode::MEMORY_BUFFER;
    WriteCallback write_callback_;
    size_t chunk_size_ = DEFAULT_CHUNK_SIZE;

    std::string buffer_;
    std::vector<std::string> element_stack_;
    std::vector<XMLAttribute> pending_attributes_;
    bool in_element_ = false;

    size_t bytes_written_ = 0;
};

}} // namespace cosmic::xml
