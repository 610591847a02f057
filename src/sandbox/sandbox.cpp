#include <gradebox/logging.hpp>
#include <gradebox/sandbox/environment.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/policy_checker.hpp>
#include <gradebox/sandbox/result_normalizer.hpp>
#include <gradebox/sandbox/sandbox.hpp>
#include <gradebox/sandbox/submission.hpp>
#include <gradebox/sandbox/supervisor.hpp>

#include <fmt/format.h>

#include <exception>
#include <utility>

namespace gradebox {

void Sandbox::require_valid(const ExecutionPolicy& policy) {
    if (auto valid = policy.validate(); !valid) {
        throw InvalidPolicyError(fmt::format("invalid execution policy: {}", valid.error()));
    }
}

ExecutionResult Sandbox::run(const ExecutionRequest& request, const CancellationToken* cancel) {
    require_valid(request.policy);

    LOG_DEBUG("Executing submission from {:?} for {:?}", request.source.student_id(), request.source.assignment_id());

    try {
        PolicyVerdict verdict = check(request.source, request.policy);

        if (verdict.is_violation()) {
            LOG_INFO("Rejected submission from {:?} ({}): nothing was run", request.source.student_id(),
                     verdict.get_kind());
            return ExecutionResult::make_policy_violation(verdict.get_reasons());
        }

        ExecutionSupervisor supervisor{request, build_environment(request.policy)};
        RawCapture raw = supervisor.run(cancel);

        return normalize(raw, ExecutionSupervisor::classify(raw), request.policy);
    } catch (const std::exception& ex) {
        // By now any child has been killed and reaped by its handle's destructor
        LOG_ERROR("Internal error while executing submission from {:?}: {}", request.source.student_id(), ex.what());

        RawCapture raw;
        raw.final_state = SupervisorState::SupervisionFailed;
        raw.internal_error = fmt::format("internal error: {}", ex.what());

        return normalize(raw, Outcome::InternalError, request.policy);
    }
}

} // namespace gradebox
