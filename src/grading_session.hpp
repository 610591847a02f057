#pragma once

#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/policy_checker.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace gradebox {

/// Identifies one submission file within a CLI session
struct SubmissionInfo
{
    /// Position on the command line
    std::size_t index = 0;

    /// As given on the command line
    std::string path;

    std::string student_id;
};

/// Totals over every submission of a session
class SessionSummary
{
public:
    void record(const ExecutionResult& result) {
        ++counts_[result.outcome()];
        total_elapsed_ += result.elapsed();
        num_cancelled_ += result.cancelled() ? 1 : 0;
    }

    /// A check-only session counts an allowed file as a success
    void record(const PolicyVerdict& verdict) {
        ++counts_[verdict.is_violation() ? Outcome::PolicyViolation : Outcome::Success];
    }

    int count(Outcome outcome) const {
        auto iter = counts_.find(outcome);
        return iter == counts_.end() ? 0 : iter->second;
    }

    int num_submissions() const {
        int total = 0;
        for (const auto& [outcome, num] : counts_) {
            total += num;
        }
        return total;
    }

    int num_succeeded() const { return count(Outcome::Success); }

    int num_failed() const { return num_submissions() - num_succeeded(); }

    bool all_succeeded() const { return num_failed() == 0; }

    int num_cancelled() const { return num_cancelled_; }

    /// Sum of the elapsed time of every run; not the wall-clock time of the session
    std::chrono::microseconds total_elapsed() const { return total_elapsed_; }

    const std::map<Outcome, int>& counts() const { return counts_; }

private:
    std::map<Outcome, int> counts_;
    std::chrono::microseconds total_elapsed_{};
    int num_cancelled_ = 0;
};

} // namespace gradebox
