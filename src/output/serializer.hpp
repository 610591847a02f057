#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/policy_checker.hpp>

#include "grading_session.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <cstddef>
#include <string_view>

namespace gradebox {

/// Turns session events into report text for a Sink
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_session_begin(ProgramOptions::Command command, std::size_t num_submissions) = 0;

    /// `check` command: the verdict for one file
    virtual void on_check_result(const SubmissionInfo& info, const PolicyVerdict& verdict) = 0;

    /// `run` command: the result for one file. Called in completion order, which with more than
    /// one job is not necessarily command-line order.
    virtual void on_execution_result(const SubmissionInfo& info, const ExecutionResult& result) = 0;

    virtual void on_session_end(const SessionSummary& summary) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace gradebox
