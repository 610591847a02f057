#include "user/cl_args.hpp"

#include <gradebox/common/error_types.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/sandbox/submission.hpp>

#include "user/program_options.hpp"
#include "version.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gradebox {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), GRADEBOX_VERSION_STRING, argparse::default_arguments::help}
    , run_parser_{"run", GRADEBOX_VERSION_STRING, argparse::default_arguments::help}
    , check_parser_{"check", GRADEBOX_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    arg_parser_.add_description(fmt::format("gradebox v{}: run student Python submissions under supervision",
                                            GRADEBOX_VERSION_STRING));

    // clang-format off

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::println(GRADEBOX_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    run_parser_.add_description("Check each file's imports, then execute it and report how it behaved");
    check_parser_.add_description("Only check each file's imports against the allow-list; nothing is executed");

    add_common_arguments(run_parser_);
    add_run_arguments(run_parser_);
    add_common_arguments(check_parser_);

    arg_parser_.add_subparser(run_parser_);
    arg_parser_.add_subparser(check_parser_);
    // clang-format on
}

void CommandLineArgs::add_common_arguments(argparse::ArgumentParser& parser) {
    // clang-format off
    parser.add_argument("files")
        .nargs(argparse::nargs_pattern::at_least_one)
        .metavar("FILE")
        .help("Python source files, one submission each");

    auto& verbose_quiet_mutex = parser.add_mutually_exclusive_group();

    {
    // Block to reduce scope of `using enum`

    using enum VerbosityLevel;

    constexpr auto DEFAULT_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
    constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
    constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

    constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE - 1;
    constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

    verbose_quiet_mutex.add_argument("-v", "--verbose")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                if (value >= MAX_VERBOSITY_VALUE) {
                    throw std::invalid_argument("Verbosity specification exceeds max level");
                }

                opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
            })
        .append()
        .help(fmt::format("Output with more verbosity (up to {}x)", MAX_VERBOSITY_INCREASE));

    verbose_quiet_mutex.add_argument("-q", "--quiet")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                if (value < MIN_VERBOSITY_VALUE) {
                    throw std::invalid_argument("Verbosity \"quietness\" specification is lower than min level");
                }

                opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
            })
        .append()
        .help(fmt::format("Output with less verbosity (up to {}x)", MAX_VERBOSITY_DECREASE));

    }

    parser.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });

    parser.add_argument("-a", "--allow")
        .append()
        .metavar("MODULES")
        .help(fmt::format("Comma-separated top-level modules submissions may import. Repeatable.\n"
                          "Replaces the default list: {}",
                          fmt::join(ExecutionPolicy::default_allowed_imports(), ",")));

    parser.add_argument("--assignment")
        .default_value(std::string{ProgramOptions::DEFAULT_ASSIGNMENT_NAME})
        .metavar("NAME")
        .nargs(1)
        .help("Assignment name used to label the report");
    // clang-format on
}

void CommandLineArgs::add_run_arguments(argparse::ArgumentParser& parser) {
    // clang-format off
    parser.add_argument("-t", "--timeout")
        .default_value(ExecutionPolicy::DEFAULT_MAX_SECONDS)
        .scan<'i', int>()
        .metavar("SECONDS")
        .help(fmt::format("Wall-clock budget for each run, in [1, {}]", ExecutionPolicy::MAX_SECONDS_LIMIT));

    parser.add_argument("--max-output")
        .default_value(ExecutionPolicy::DEFAULT_MAX_OUTPUT_BYTES)
        .scan<'u', std::size_t>()
        .metavar("BYTES")
        .help("Cap applied to each of stdout and stderr");

    parser.add_argument("--interpreter")
        .default_value(std::string{ExecutionPolicy::DEFAULT_INTERPRETER})
        .metavar("PATH")
        .nargs(1)
        .help("Absolute path of the Python interpreter");

    parser.add_argument("--stdin")
        .metavar("FILE")
        .nargs(1)
        .help("File whose contents are fed to every run's standard input (default: /dev/null)");

    parser.add_argument("-e", "--env")
        .append()
        .metavar("KEY=VALUE")
        .help("Extra variable for the child environment. Repeatable. Nothing is inherited otherwise.");

    parser.add_argument("--strip-ansi")
        .flag()
        .help("Remove terminal escape sequences from captured output");

    parser.add_argument("-j", "--jobs")
        .default_value(ProgramOptions::DEFAULT_JOBS)
        .scan<'u', std::size_t>()
        .metavar("N")
        .help("Number of submissions to run at once (0 = one per hardware thread)");
    // clang-format on
}

std::vector<std::string> CommandLineArgs::split_module_lists(const std::vector<std::string>& lists) {
    std::vector<std::string> modules;

    for (std::string_view list : lists) {
        while (!list.empty()) {
            const auto comma_pos = list.find(',');
            std::string_view name = list.substr(0, comma_pos);

            const auto first = name.find_first_not_of(' ');
            if (first != std::string_view::npos) {
                name = name.substr(first, name.find_last_not_of(' ') - first + 1);
                modules.emplace_back(name);
            }

            if (comma_pos == std::string_view::npos) {
                break;
            }
            list.remove_prefix(comma_pos + 1);
        }
    }

    return modules;
}

void CommandLineArgs::collect_values(const argparse::ArgumentParser& parser) {
    opts_buffer_.files = parser.get<std::vector<std::string>>("files");
    opts_buffer_.assignment_name = parser.get<std::string>("--assignment");

    if (auto allowed = parser.present<std::vector<std::string>>("--allow")) {
        opts_buffer_.allowed_imports = split_module_lists(*allowed);
    }

    if (opts_buffer_.command != ProgramOptions::Command::Run) {
        return;
    }

    opts_buffer_.timeout_seconds = parser.get<int>("--timeout");
    opts_buffer_.max_output_bytes = parser.get<std::size_t>("--max-output");
    opts_buffer_.interpreter = parser.get<std::string>("--interpreter");
    opts_buffer_.stdin_file = parser.present<std::string>("--stdin");
    opts_buffer_.strip_ansi = parser.get<bool>("--strip-ansi");
    opts_buffer_.jobs = parser.get<std::size_t>("--jobs");

    if (auto env = parser.present<std::vector<std::string>>("--env")) {
        opts_buffer_.env_assignments = *env;
    }
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);

        if (arg_parser_.is_subcommand_used(run_parser_)) {
            opts_buffer_.command = ProgramOptions::Command::Run;
            collect_values(run_parser_);
        } else if (arg_parser_.is_subcommand_used(check_parser_)) {
            opts_buffer_.command = ProgramOptions::Command::Check;
            collect_values(check_parser_);
        } else {
            return std::string{"Expected a command: 'run' or 'check'"};
        }
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed options: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::println(stderr, "{}\n{}", styled(opts_res.error(), fg(fmt::color::red)), cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace gradebox
