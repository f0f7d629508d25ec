#pragma once

#include <string>
#include <vector>

#include "loop/orchestrator.hpp"

namespace selfrepair::loop {

struct BatchItem {
    EvaluationReport report;
    // Set when provisioning failed; the report then holds the attempts
    // recorded before the failure.
    std::string infrastructure_error;
};

// Evaluates independent tasks on a fixed number of worker threads.
// Every task gets its own Orchestrator; the collaborators passed in must
// tolerate concurrent calls.
class BatchEvaluator {
public:
    BatchEvaluator(selfrepair::generator::CodeGenerator& generator,
                   const selfrepair::guard::GuardrailScanner& scanner,
                   selfrepair::sandbox::Executor& executor,
                   selfrepair::config::LoopConfig config,
                   int jobs);

    // Results keep the order of the input tasks.
    std::vector<BatchItem> Run(const std::vector<selfrepair::task::Task>& tasks,
                               int max_attempts) const;

private:
    selfrepair::generator::CodeGenerator& generator_;
    const selfrepair::guard::GuardrailScanner& scanner_;
    selfrepair::sandbox::Executor& executor_;
    selfrepair::config::LoopConfig config_;
    int jobs_ = 1;
};

}  // namespace selfrepair::loop
