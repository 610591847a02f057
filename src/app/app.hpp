#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/sandbox/submission.hpp>

#include "app/trace_exception.hpp"
#include "grading_session.hpp"
#include "output/serializer.hpp"
#include "user/program_options.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace gradebox {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    /// Returns the process exit code
    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(EXIT_INTERNAL_ERROR);
    }

    /// The number of failed submissions is the exit code, up to this value
    static constexpr int MAX_FAILURE_EXIT_CODE = 125;
    static constexpr int EXIT_USAGE_ERROR = 126;
    static constexpr int EXIT_INTERNAL_ERROR = 127;

    static int failures_exit_code(int num_failures);

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;

    struct LoadedSubmission
    {
        SubmissionInfo info;
        SubmissionSource source;
    };

    struct LoadResult
    {
        std::vector<LoadedSubmission> submissions;
        int num_unreadable = 0;
    };

    /// Read every file named on the command line. Unreadable files are reported via `serializer`.
    LoadResult load_submissions(Serializer& serializer) const;
};

} // namespace gradebox
