#pragma once

#include <gradebox/sandbox/execution_result.hpp>
#include <gradebox/sandbox/policy_checker.hpp>

#include "grading_session.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    /// Fixed width, for output that isn't going to a terminal (and for tests)
    PlainTextSerializer(Sink& sink, bool colorize, VerbosityLevel verbosity, std::size_t width);

    void on_session_begin(ProgramOptions::Command command, std::size_t num_submissions) override;

    void on_check_result(const SubmissionInfo& info, const PolicyVerdict& verdict) override;
    void on_execution_result(const SubmissionInfo& info, const ExecutionResult& result) override;

    void on_session_end(const SessionSummary& summary) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

    /// Conditionally make a word singular or plural based on `count`
    /// Singular if and only if `count == 1`
    ///
    /// Examples:
    ///  pluralize("submission", 0) => "submissions"
    ///  pluralize("import", 1) => "import"
    ///  pluralize("datum", 42, "a", 2) => "data"
    static std::string pluralize(std::string_view root, int count, std::string_view suffix = "s",
                                 std::size_t replace_last_chars = 0);

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    static fmt::text_style outcome_style(Outcome outcome);

    /// "Submission: <name>" header shared by both commands
    std::string submission_header(const SubmissionInfo& info) const;

    /// e.g. "exited with code 1, 0.031s"
    static std::string result_details(const ExecutionResult& result);

    /// A captured stream under a small header, with a note if it was cut short
    std::string captured_stream_block(std::string_view name, const CapturedStream& stream) const;

    std::string diagnostics_block(std::string_view label, const std::vector<std::string>& lines) const;

    template <fmt::formattable T>
    auto style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style));

    template <fmt::formattable T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    // Basic styles for different kinds of output:
    //   error    - failing outcomes, fatal errors, etc.
    //   success  - successful outcomes and allowed verdicts
    //   pop out  - submission names
    //   value    - literal values, like module names
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto POP_OUT_STYLE =
        fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::golden_rod);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Basic line dividers to seperate output, parameterized on length
    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');

    bool do_colorize_;
    std::size_t terminal_width_;

    ProgramOptions::Command command_ = ProgramOptions::Command::Run;
};

template <fmt::formattable T>
auto PlainTextSerializer::style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style)) {
    if (!do_colorize_) {
        return fmt::styled(arg, {});
    }
    return fmt::styled(arg, style);
}

template <fmt::formattable T>
std::string PlainTextSerializer::style_str(const T& arg, fmt::text_style style) const {
    if (!do_colorize_) {
        return fmt::format("{}", arg);
    }

    return fmt::format(style, "{}", arg);
}

} // namespace gradebox
