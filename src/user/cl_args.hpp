#pragma once

#include <gradebox/common/expected.hpp>

#include "user/program_options.hpp"

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace gradebox {

/// Just a wrapper around argparse for now
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed and validated program options
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

private:
    /// Set up the top-level parser and both subcommands
    void setup_parser();

    /// Options shared by `run` and `check`
    void add_common_arguments(argparse::ArgumentParser& parser);

    /// Options only meaningful when submissions are executed
    void add_run_arguments(argparse::ArgumentParser& parser);

    /// Copy parsed values out of whichever subcommand was used
    void collect_values(const argparse::ArgumentParser& parser);

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    /// `--allow a,b --allow c` => {"a", "b", "c"}
    static std::vector<std::string> split_module_lists(const std::vector<std::string>& lists);

    argparse::ArgumentParser arg_parser_;
    argparse::ArgumentParser run_parser_;
    argparse::ArgumentParser check_parser_;

    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};

    using VerbosityLevelUnderlyingT = std::underlying_type_t<VerbosityLevel>;
};

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = 2) noexcept;

} // namespace gradebox
