#include <gradebox/logging.hpp>
#include <gradebox/sandbox/batch_runner.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/sandbox.hpp>

#include <libassert/assert.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace gradebox {

BatchRunner::BatchRunner(std::size_t num_workers)
    : num_workers_{num_workers != 0 ? num_workers : std::max(1U, std::thread::hardware_concurrency())} {}

std::vector<ExecutionResult> BatchRunner::run_all(const std::vector<ExecutionRequest>& requests,
                                                  const CancellationToken* cancel) const {
    for (const ExecutionRequest& request : requests) {
        Sandbox::require_valid(request.policy);
    }

    std::vector<std::optional<ExecutionResult>> slots(requests.size());
    std::atomic<std::size_t> next_index{0};
    std::mutex callback_mutex;

    auto worker = [&] {
        for (std::size_t idx = next_index++; idx < requests.size(); idx = next_index++) {
            slots[idx] = Sandbox::run(requests[idx], cancel);

            if (on_result_) {
                std::scoped_lock lock{callback_mutex};
                on_result_(idx, requests[idx], *slots[idx]);
            }
        }
    };

    const std::size_t num_threads = std::min(num_workers_, requests.size());
    LOG_DEBUG("Running {} requests on {} workers", requests.size(), num_threads);

    {
        std::vector<std::jthread> threads;
        threads.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            threads.emplace_back(worker);
        }
        // jthreads join on destruction
    }

    std::vector<ExecutionResult> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        ASSERT(slot.has_value(), "every request must have been run");
        results.push_back(std::move(*slot));
    }

    return results;
}

} // namespace gradebox
