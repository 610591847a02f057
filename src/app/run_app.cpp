#include "app/run_app.hpp"

#include <gradebox/logging.hpp>
#include <gradebox/sandbox/batch_runner.hpp>
#include <gradebox/sandbox/cancellation.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/submission.hpp>

#include "app/interrupt_watcher.hpp"
#include "grading_session.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace gradebox {

int RunApp::run_impl() {
    StdoutSink output_sink;
    PlainTextSerializer serializer{output_sink, OPTS.colorize_option, OPTS.verbosity};

    auto policy = OPTS.make_policy();
    if (!policy) {
        serializer.on_error(policy.error());
        return EXIT_USAGE_ERROR;
    }

    // Before any worker thread exists, so that they all inherit the blocked signals
    CancellationToken cancel;
    InterruptWatcher interrupt_watcher{cancel};

    LoadResult loaded = load_submissions(serializer);

    std::vector<ExecutionRequest> requests =
        loaded.submissions |
        ranges::views::transform([&](const LoadedSubmission& sub) { return ExecutionRequest{sub.source, *policy}; }) |
        ranges::to<std::vector>();

    SessionSummary summary;

    BatchRunner runner{OPTS.jobs};
    runner.set_result_callback(
        [&](std::size_t index, const ExecutionRequest& /*request*/, const ExecutionResult& result) {
            summary.record(result);
            serializer.on_execution_result(loaded.submissions[index].info, result);
            output_sink.flush();
        });

    LOG_DEBUG("Running {} submissions with {} workers", requests.size(), runner.num_workers());

    serializer.on_session_begin(ProgramOptions::Command::Run, OPTS.files.size());
    runner.run_all(requests, &cancel);
    serializer.on_session_end(summary);
    serializer.finalize();

    return failures_exit_code(summary.num_failed() + loaded.num_unreadable);
}

} // namespace gradebox
