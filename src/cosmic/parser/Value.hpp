#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cosmic {
namespace parser {

class Value;

/**
 * @brief 有序映射，键唯一
 *
 * 保持插入顺序；对已有键赋值时原位替换，不改变位置。
 */
class Mapping {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;
    using iterator = std::vector<Entry>::iterator;

    Mapping() = default;

    /**
     * @brief 设置键值，已存在则原位替换
     */
    void set(std::string key, Value value);

    bool contains(const std::string& key) const;
    const Value* find(const std::string& key) const;
    Value* find(const std::string& key);

    /**
     * @throws ParameterException 键不存在
     */
    const Value& at(const std::string& key) const;

    size_t size() const;
    bool empty() const;

    const_iterator begin() const;
    const_iterator end() const;
    iterator begin();
    iterator end();

    /**
     * @brief 将另一个映射的条目依次合并进来（同名键替换）
     */
    void merge(Mapping&& other);

    bool operator==(const Mapping& other) const;
    bool operator!=(const Mapping& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

using List = std::vector<Value>;

/**
 * @brief 解析得到的层级值
 *
 * 显式标签联合：Null / Boolean / Integer / Float / String / List / Mapping
 */
class Value {
public:
    enum class Type {
        Null,
        Boolean,
        Integer,
        Float,
        String,
        List,
        Mapping
    };

    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, List, Mapping>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    Value(int v) : data_(static_cast<int64_t>(v)) {}
    Value(int64_t v) : data_(v) {}
    Value(double v) : data_(v) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(List l) : data_(std::move(l)) {}
    Value(Mapping m) : data_(std::move(m)) {}

    Type type() const { return static_cast<Type>(data_.index()); }

    bool isNull() const { return type() == Type::Null; }
    bool isBool() const { return type() == Type::Boolean; }
    bool isInteger() const { return type() == Type::Integer; }
    bool isFloat() const { return type() == Type::Float; }
    bool isNumber() const { return isInteger() || isFloat(); }
    bool isString() const { return type() == Type::String; }
    bool isList() const { return type() == Type::List; }
    bool isMapping() const { return type() == Type::Mapping; }
    bool isScalar() const { return !isList() && !isMapping(); }

    // 类型不匹配时抛出 OperationException
    bool asBool() const;
    int64_t asInteger() const;
    double asFloat() const;
    const std::string& asString() const;
    const List& asList() const;
    List& asList();
    const Mapping& asMapping() const;
    Mapping& asMapping();

    /**
     * @brief 标量的文本形式（与配置作者书写一致）
     *
     * 整数不带小数点，浮点数使用最短往返表示，布尔为 True/False，
     * 空值为空串。容器类型抛出 OperationException。
     */
    std::string toScalarString() const;

    /**
     * @brief 规范化输出，用于日志与相等性比较
     *
     * 输出为单行流式表示，例如 {a: 1, b: [x, null]}
     */
    std::string dump() const;

    const Storage& storage() const { return data_; }

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

    static const char* typeName(Type type);

private:
    Storage data_;
};

// Mapping 的内联成员需要 Value 为完整类型
inline size_t Mapping::size() const { return entries_.size(); }
inline bool Mapping::empty() const { return entries_.empty(); }
inline Mapping::const_iterator Mapping::begin() const { return entries_.begin(); }
inline Mapping::const_iterator Mapping::end() const { return entries_.end(); }
inline Mapping::iterator Mapping::begin() { return entries_.begin(); }
inline Mapping::iterator Mapping::end() { return entries_.end(); }

}} // namespace cosmic::parser
