#include "cosmic/model/CosmicCalculator.hpp"
#include "cosmic/utils/ModuleLoggers.hpp"

#include <unordered_map>

namespace cosmic {
namespace model {

CosmicCalculator::CosmicCalculator(const SystemMeasurement& measurement)
    : measurement_(measurement) {
}

FunctionalProcessSummary CosmicCalculator::summarizeFunctionalProcess(const FunctionalProcess& process) {
    FunctionalProcessSummary summary;
    summary.name = process.name;
    summary.entry_count = process.countMovements(DataMovementType::Entry);
    summary.exit_count = process.countMovements(DataMovementType::Exit);
    summary.read_count = process.countMovements(DataMovementType::Read);
    summary.write_count = process.countMovements(DataMovementType::Write);
    summary.total_cfp = process.totalCfp();
    summary.trigger = process.trigger;
    summary.object_of_interest = process.object_of_interest;
    summary.description = process.description;
    return summary;
}

std::vector<FunctionalProcessSummary> CosmicCalculator::summarize() const {
    std::vector<FunctionalProcessSummary> summaries;
    std::unordered_map<std::string, size_t> positions;
    summaries.reserve(measurement_.functional_processes.size());

    for (const auto& process : measurement_.functional_processes) {
        auto it = positions.find(process.name);
        if (it != positions.end()) {
            MODEL_WARN("Duplicate functional process name '{}', later definition replaces the earlier summary",
                       process.name);
            summaries[it->second] = summarizeFunctionalProcess(process);
            continue;
        }
        positions.emplace(process.name, summaries.size());
        summaries.push_back(summarizeFunctionalProcess(process));
    }
    return summaries;
}

}} // namespace cosmic::model
