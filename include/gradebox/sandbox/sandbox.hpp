#pragma once

#include <gradebox/sandbox/cancellation.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/submission.hpp>

namespace gradebox {

/// Entry point for the grading layer: check, build the environment, supervise, normalize
class Sandbox
{
public:
    /// Execute one request. Every way a submission can misbehave is reported through the returned
    /// result; nothing is spawned unless the submission passes the policy check.
    ///
    /// Throws InvalidPolicyError if `request.policy` fails validation.
    /// `cancel`, if given, must outlive the call.
    static ExecutionResult run(const ExecutionRequest& request, const CancellationToken* cancel = nullptr);

    /// Throws InvalidPolicyError naming the problem if `policy` is invalid
    static void require_valid(const ExecutionPolicy& policy);
};

} // namespace gradebox
