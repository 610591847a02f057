#pragma once

#include <gradebox/sandbox/cancellation.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/submission.hpp>

#include <cstddef>
#include <functional>
#include <vector>

namespace gradebox {

/// Runs independent execution requests concurrently on a fixed number of worker threads.
/// Each request gets its own supervisor and child; nothing is shared between them.
class BatchRunner
{
public:
    /// Invoked once per finished request, from the worker that ran it. Calls are serialized.
    using ResultCallback = std::function<void(std::size_t index, const ExecutionRequest&, const ExecutionResult&)>;

    /// `num_workers == 0` means one per hardware thread
    explicit BatchRunner(std::size_t num_workers);

    void set_result_callback(ResultCallback callback) { on_result_ = std::move(callback); }

    std::size_t num_workers() const { return num_workers_; }

    /// Execute every request; results are in request order.
    ///
    /// All policies are validated before anything runs, so an InvalidPolicyError leaves no
    /// request half-done. Requests not yet started when `cancel` fires still run, and finish
    /// immediately as cancelled timeouts.
    std::vector<ExecutionResult> run_all(const std::vector<ExecutionRequest>& requests,
                                         const CancellationToken* cancel = nullptr) const;

private:
    std::size_t num_workers_;
    ResultCallback on_result_;
};

} // namespace gradebox
