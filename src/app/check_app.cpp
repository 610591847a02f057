#include "app/check_app.hpp"

#include <gradebox/logging.hpp>
#include <gradebox/sandbox/policy_checker.hpp>

#include "grading_session.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"

namespace gradebox {

int CheckApp::run_impl() {
    StdoutSink output_sink;
    PlainTextSerializer serializer{output_sink, OPTS.colorize_option, OPTS.verbosity};

    auto policy = OPTS.make_policy();
    if (!policy) {
        serializer.on_error(policy.error());
        return EXIT_USAGE_ERROR;
    }

    LoadResult loaded = load_submissions(serializer);
    SessionSummary summary;

    serializer.on_session_begin(ProgramOptions::Command::Check, OPTS.files.size());

    for (const LoadedSubmission& sub : loaded.submissions) {
        PolicyVerdict verdict = check(sub.source, *policy);

        LOG_DEBUG("{:?}: {} with {} imports", sub.info.path, verdict.get_kind(), verdict.get_imports().size());

        summary.record(verdict);
        serializer.on_check_result(sub.info, verdict);
    }

    serializer.on_session_end(summary);
    serializer.finalize();

    return failures_exit_code(summary.num_failed() + loaded.num_unreadable);
}

} // namespace gradebox
