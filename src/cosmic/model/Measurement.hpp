#pragma once

#include "cosmic/parser/Value.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace cosmic {
namespace model {

/**
 * @brief COSMIC 数据移动类型
 */
enum class DataMovementType : char {
    Entry = 'E',
    Exit = 'X',
    Read = 'R',
    Write = 'W'
};

/**
 * @brief 解析移动类型：单个字母（E/X/R/W）或完整单词，大小写不敏感
 * @throws ConfigException 不支持的类型
 */
DataMovementType dataMovementTypeFromString(const std::string& value);

// 单字母表示
const char* toString(DataMovementType type);

/**
 * @brief 单个数据移动
 */
struct DataMovement {
    DataMovementType type = DataMovementType::Entry;
    std::string description;
    std::optional<std::string> object_of_interest;
    std::optional<std::string> trigger;
    std::optional<std::string> code_reference;
    std::optional<std::string> notes;

    /**
     * @brief 从映射构建
     *
     * 必须包含 type 与 description；
     * object_of_interest 可写作 ooi，notes 可写作 additional_notes。
     *
     * @throws ConfigException 缺少字段或类型不支持
     */
    static DataMovement fromValue(const parser::Value& value);
};

/**
 * @brief 功能处理
 */
struct FunctionalProcess {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> trigger;
    std::optional<std::string> object_of_interest;
    std::vector<DataMovement> data_movements;

    static FunctionalProcess fromValue(const parser::Value& value);

    size_t countMovements(DataMovementType type) const;

    // 每个数据移动计 1 CFP
    size_t totalCfp() const { return data_movements.size(); }
};

/**
 * @brief 一个系统边界内的完整度量
 */
struct SystemMeasurement {
    static constexpr const char* DEFAULT_NAME = "Unnamed System";

    std::string name = DEFAULT_NAME;
    std::optional<std::string> boundary;
    std::optional<std::string> description;
    std::vector<std::string> persistence_resources;
    std::vector<std::string> external_actors;
    std::vector<std::string> objects_of_interest;
    std::vector<FunctionalProcess> functional_processes;

    /**
     * @brief 从文档根映射构建
     * @throws ConfigException 结构不符合要求
     */
    static SystemMeasurement fromValue(const parser::Value& root);

    size_t totalCfp() const;
};

namespace detail {

/**
 * @brief 按别名顺序取第一个非空标量
 * @throws ConfigException 取到的值不是标量
 */
std::optional<std::string> firstScalar(const parser::Mapping& mapping,
                                       std::initializer_list<const char*> aliases);

/**
 * @brief 标量列表（单个标量视为一个元素）
 */
std::vector<std::string> scalarList(const parser::Mapping& mapping,
                                    std::initializer_list<const char*> aliases);

} // namespace detail

}} // namespace cosmic::model
