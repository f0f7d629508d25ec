#include "loop/batch_evaluator.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

#include "sandbox/container_runtime.hpp"
#include "utils/logging.hpp"

namespace selfrepair::loop {

BatchEvaluator::BatchEvaluator(selfrepair::generator::CodeGenerator& generator,
                               const selfrepair::guard::GuardrailScanner& scanner,
                               selfrepair::sandbox::Executor& executor,
                               selfrepair::config::LoopConfig config,
                               int jobs)
    : generator_(generator)
    , scanner_(scanner)
    , executor_(executor)
    , config_(std::move(config))
    , jobs_(std::max(1, jobs)) {}

std::vector<BatchItem> BatchEvaluator::Run(const std::vector<selfrepair::task::Task>& tasks,
                                           int max_attempts) const {
    std::vector<BatchItem> results(tasks.size());
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        for (auto index = next.fetch_add(1); index < tasks.size(); index = next.fetch_add(1)) {
            const auto& task = tasks[index];
            Orchestrator orchestrator(generator_, scanner_, executor_, config_);
            try {
                results[index].report = orchestrator.Evaluate(task, max_attempts);
            } catch (const AbortedEvaluation& ex) {
                utils::Log(utils::LogLevel::kError, "batch", "provisioning failed", {
                    {"task", task.id},
                    {"attempts_kept", std::to_string(ex.Partial().attempts.size())},
                    {"error", ex.what()}});
                results[index].report = ex.Partial();
                results[index].infrastructure_error = ex.what();
            } catch (const selfrepair::sandbox::ProvisioningError& ex) {
                utils::Log(utils::LogLevel::kError, "batch", "provisioning failed", {
                    {"task", task.id},
                    {"error", ex.what()}});
                results[index].report.task_id = task.id;
                results[index].infrastructure_error = ex.what();
            } catch (const std::exception& ex) {
                // An escaping exception would terminate the worker thread.
                utils::Log(utils::LogLevel::kError, "batch", "evaluation aborted", {
                    {"task", task.id},
                    {"error", ex.what()}});
                results[index].report.task_id = task.id;
                results[index].infrastructure_error = ex.what();
            }
        }
    };

    const auto thread_count = std::min<std::size_t>(static_cast<std::size_t>(jobs_), tasks.size());
    utils::Log(utils::LogLevel::kInfo, "batch", "starting", {
        {"tasks", std::to_string(tasks.size())},
        {"workers", std::to_string(thread_count)}});
    if (thread_count <= 1) {
        worker();
        return results;
    }

    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return results;
}

}  // namespace selfrepair::loop
