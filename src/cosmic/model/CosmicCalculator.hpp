#pragma once

#include "cosmic/model/Measurement.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cosmic {
namespace model {

/**
 * @brief 单个功能处理的汇总
 */
struct FunctionalProcessSummary {
    std::string name;
    size_t entry_count = 0;
    size_t exit_count = 0;
    size_t read_count = 0;
    size_t write_count = 0;
    size_t total_cfp = 0;
    std::optional<std::string> trigger;
    std::optional<std::string> object_of_interest;
    std::optional<std::string> description;
};

/**
 * @brief CFP 计算器
 */
class CosmicCalculator {
public:
    explicit CosmicCalculator(const SystemMeasurement& measurement);

    static FunctionalProcessSummary summarizeFunctionalProcess(const FunctionalProcess& process);

    /**
     * @brief 按处理顺序汇总
     *
     * 名称重复的处理会替换先前的汇总，位置保持在首次出现处。
     */
    std::vector<FunctionalProcessSummary> summarize() const;

    // 全部处理的 CFP 之和（包括名称重复的处理）
    size_t totalCfp() const { return measurement_.totalCfp(); }

private:
    const SystemMeasurement& measurement_;
};

}} // namespace cosmic::model
