#include "output/plaintext_serializer.hpp"

#include <gradebox/logging.hpp>
#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/policy_checker.hpp>

#include "common/terminal_checks.hpp"
#include "grading_session.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <gsl/util>

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include <sys/ioctl.h>

namespace gradebox {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

PlainTextSerializer::PlainTextSerializer(Sink& sink, bool colorize, VerbosityLevel verbosity, std::size_t width)
    : Serializer{sink, verbosity}
    , do_colorize_{colorize}
    , terminal_width_{width} {}

void PlainTextSerializer::on_session_begin(ProgramOptions::Command command, std::size_t num_submissions) {
    command_ = command;

    if (!should_output_submission_block(verbosity_)) {
        return;
    }

    const auto count = gsl::narrow_cast<int>(num_submissions);
    const std::string_view verb = command == ProgramOptions::Command::Run ? "Running" : "Checking";

    sink_.write(fmt::format("{} {} {}\n", verb, count, pluralize("submission", count)));
}

void PlainTextSerializer::on_check_result(const SubmissionInfo& info, const PolicyVerdict& verdict) {
    const auto verdict_style = verdict.is_violation() ? ERROR_STYLE : SUCCESS_STYLE;

    if (should_output_submission_line(verbosity_)) {
        sink_.write(fmt::format("{}: {}\n", info.path, style(verdict.get_kind(), verdict_style)));
        return;
    }

    if (!should_output_submission_block(verbosity_)) {
        return;
    }

    const auto num_imports = gsl::narrow_cast<int>(verdict.get_imports().size());

    std::string out = submission_header(info);

    if (verdict.get_kind() == PolicyVerdict::Kind::Unparseable) {
        out += fmt::format("Verdict: {}\n", style(verdict.get_kind(), verdict_style));
    } else {
        out += fmt::format("Verdict: {} ({} {})\n", style(verdict.get_kind(), verdict_style), num_imports,
                           pluralize("import", num_imports));
    }

    if (should_output_imports(verbosity_) && num_imports > 0) {
        out += "Imports:\n";

        for (const ImportRecord& record : verdict.get_imports()) {
            const std::string dots(gsl::narrow_cast<std::size_t>(record.level), '.');

            out += fmt::format("  line {}: {}{}{}\n", record.line, dots, style(record.module, VALUE_STYLE),
                               record.is_relative() ? " (relative)" : "");
        }
    }

    out += diagnostics_block("Reasons", verdict.get_reasons());

    sink_.write(out);
}

void PlainTextSerializer::on_execution_result(const SubmissionInfo& info, const ExecutionResult& result) {
    const auto outcome = result.outcome();

    if (should_output_submission_line(verbosity_)) {
        sink_.write(fmt::format("{}: {} ({})\n", info.path, style(outcome, outcome_style(outcome)),
                                result_details(result)));
        return;
    }

    if (!should_output_submission_block(verbosity_)) {
        return;
    }

    std::string out = submission_header(info);

    out += fmt::format("Outcome: {} ({})\n", style(outcome, outcome_style(outcome)), result_details(result));

    if (outcome != Outcome::PolicyViolation && should_output_streams(verbosity_, result.succeeded())) {
        out += captured_stream_block("stdout", result.stdout_stream());
        out += captured_stream_block("stderr", result.stderr_stream());
    }

    out += diagnostics_block(outcome == Outcome::PolicyViolation ? "Reasons" : "Errors", result.diagnostics());

    sink_.write(out);
}

void PlainTextSerializer::on_session_end(const SessionSummary& summary) {
    if (!should_output_totals(verbosity_)) {
        return;
    }

    const int total = summary.num_submissions();

    std::string out = LINE_DIVIDER_EM(terminal_width_) + "\n";

    if (summary.all_succeeded()) {
        const std::string_view what =
            command_ == ProgramOptions::Command::Run ? "All submissions succeeded" : "All submissions passed";

        out += fmt::format("{} ({} {})\n", style_str(what, SUCCESS_STYLE), total, pluralize("submission", total));
        sink_.write(out);
        return;
    }

    std::string succeeded_msg = fmt::format("{} succeeded", summary.num_succeeded());
    std::string failed_msg = fmt::format("{} failed", summary.num_failed());

    out += fmt::format("Submissions: {} total | {} | {}\n", total, style(succeeded_msg, SUCCESS_STYLE),
                       style(failed_msg, ERROR_STYLE));

    for (const auto& [outcome, num] : summary.counts()) {
        if (outcome == Outcome::Success || num == 0) {
            continue;
        }
        out += fmt::format("  {}: {}\n", style(outcome, outcome_style(outcome)), num);
    }

    if (summary.num_cancelled() > 0) {
        out += style_str(fmt::format("{} {} cancelled before finishing", summary.num_cancelled(),
                                     summary.num_cancelled() == 1 ? "run was" : "runs were"),
                         WARNING_STYLE);
        out += "\n";
    }

    sink_.write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    sink_.write(style_str(what, WARNING_STYLE) + "\n");
}

void PlainTextSerializer::on_error(std::string_view what) {
    sink_.write(style_str(what, ERROR_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

std::string PlainTextSerializer::submission_header(const SubmissionInfo& info) const {
    return fmt::format("{}\nSubmission: {}\n", LINE_DIVIDER_EM(terminal_width_), style(info.path, POP_OUT_STYLE));
}

std::string PlainTextSerializer::result_details(const ExecutionResult& result) {
    if (result.outcome() == Outcome::PolicyViolation) {
        return "not run";
    }

    std::string details;

    if (result.exit_status()) {
        details = fmt::format("{}, ", *result.exit_status());
    }

    details += fmt::format("{:.3f}s", std::chrono::duration<double>(result.elapsed()).count());

    if (result.cancelled()) {
        details += ", cancelled";
    }

    return details;
}

std::string PlainTextSerializer::captured_stream_block(std::string_view name, const CapturedStream& stream) const {
    if (stream.text.empty() && !stream.truncated) {
        return fmt::format("{} {} (empty)\n", LINE_DIVIDER(3), name);
    }

    std::string out = fmt::format("{} {} {}\n", LINE_DIVIDER(3), name, LINE_DIVIDER(3));
    out += stream.text;

    if (!stream.text.empty() && stream.text.back() != '\n') {
        out += "\n";
    }

    if (stream.truncated) {
        out += style_str("[output truncated]", WARNING_STYLE) + "\n";
    }

    return out;
}

std::string PlainTextSerializer::diagnostics_block(std::string_view label,
                                                   const std::vector<std::string>& lines) const {
    if (lines.empty()) {
        return {};
    }

    std::string out = fmt::format("{}:\n", label);

    for (const std::string& line : lines) {
        out += fmt::format("  {}\n", line);
    }

    return out;
}

fmt::text_style PlainTextSerializer::outcome_style(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success:
        return SUCCESS_STYLE;
    case Outcome::InternalError:
        return WARNING_STYLE;
    default:
        return ERROR_STYLE;
    }
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, int count, std::string_view suffix,
                                           std::size_t replace_last_chars) {
    if (count == 1) {
        return std::string{root};
    }

    root.remove_suffix(replace_last_chars);

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because '{}'. Defaulting to {}", width.error().message(),
                  DEFAULT_WIDTH);
    }

    // A pipe or an unset terminal reports zero columns
    const std::size_t result = width.value_or(DEFAULT_WIDTH);
    return result == 0 ? DEFAULT_WIDTH : result;
}

} // namespace gradebox
