#include "catch2_custom.hpp"

#include <gradebox/sandbox/submission.hpp>
#include <gradebox/subprocess/scratch_dir.hpp>

#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>

#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace gradebox;
using namespace std::literals;

namespace {

/// Options that validate, with one real submission file
struct ValidOptions
{
    ValidOptions() {
        auto dir = ScratchDir::create();
        REQUIRE(dir);
        scratch.emplace(std::move(dir).value());

        submission = value_or_fail(scratch->write_file("alice.py", "print('hi')\n"));
        stdin_path = value_or_fail(scratch->write_file("input.txt", "1\n2\n"));

        opts.files = {submission};
    }

    static std::string value_or_fail(Expected<std::string> res) {
        REQUIRE(res);
        return res.value();
    }

    std::optional<ScratchDir> scratch;
    std::string submission;
    std::string stdin_path;
    ProgramOptions opts;
};

} // namespace

TEST_CASE("Default options build the default policy") {
    ValidOptions valid;

    REQUIRE(valid.opts.validate());

    auto policy = valid.opts.make_policy();
    REQUIRE(policy);
    REQUIRE(policy->max_seconds == ExecutionPolicy::DEFAULT_MAX_SECONDS);
    REQUIRE(policy->max_output_bytes == ExecutionPolicy::DEFAULT_MAX_OUTPUT_BYTES);
    REQUIRE(policy->allowed_imports == ExecutionPolicy::default_allowed_imports());
    REQUIRE(policy->interpreter == "/usr/bin/python3");
    REQUIRE(policy->stdin_data.empty());
    REQUIRE(policy->extra_environment.empty());
    REQUIRE(!policy->strip_ansi_escapes);
}

TEST_CASE("Options map onto the policy") {
    ValidOptions valid;
    auto& opts = valid.opts;

    opts.timeout_seconds = 5;
    opts.max_output_bytes = 100;
    opts.allowed_imports = {"math", "os"};
    opts.stdin_file = valid.stdin_path;
    opts.env_assignments = {"MPLBACKEND=Agg", "EQUATION=a=b", "EMPTY="};
    opts.strip_ansi = true;

    REQUIRE(opts.validate());

    auto policy = opts.make_policy();
    REQUIRE(policy);
    REQUIRE(policy->max_seconds == 5);
    REQUIRE(policy->max_output_bytes == 100);
    REQUIRE(policy->allowed_imports == std::vector<std::string>{"math", "os"});
    REQUIRE(policy->stdin_data == "1\n2\n");
    REQUIRE(policy->extra_environment ==
            std::map<std::string, std::string>{{"MPLBACKEND", "Agg"}, {"EQUATION", "a=b"}, {"EMPTY", ""}});
    REQUIRE(policy->strip_ansi_escapes);
}

TEST_CASE("Validation errors") {
    ValidOptions valid;
    auto& opts = valid.opts;

    SECTION("No files") {
        opts.files.clear();
        REQUIRE(opts.validate() == "No submission files given"s);
    }

    SECTION("Missing file") {
        opts.files.push_back("/nonexistent/bob.py");
        REQUIRE(opts.validate() == "Submission file \"/nonexistent/bob.py\" does not exist"s);
    }

    SECTION("Directory instead of a file") {
        opts.files = {valid.scratch->path()};
        REQUIRE(opts.validate() == fmt::format("Submission file {:?} is not a regular file", valid.scratch->path()));
    }

    SECTION("Missing stdin file") {
        opts.stdin_file = "/nonexistent/input.txt";
        REQUIRE(opts.validate() == "Standard input file \"/nonexistent/input.txt\" does not exist"s);
    }

    SECTION("Empty assignment name") {
        opts.assignment_name.clear();
        REQUIRE(opts.validate() == "Assignment name may not be empty"s);
    }

    SECTION("Out of range timeout") {
        opts.timeout_seconds = 0;
        REQUIRE(opts.validate() == "max_seconds must be in [1, 3600], got 0"s);
    }

    SECTION("Relative interpreter") {
        opts.interpreter = "python3";
        REQUIRE(opts.validate() == "interpreter must be an absolute path, got \"python3\""s);
    }

    SECTION("Malformed environment assignment") {
        opts.env_assignments = {"NOVALUE"};
        REQUIRE(opts.validate() == "Environment assignment \"NOVALUE\" is not of the form KEY=VALUE"s);
    }

    SECTION("Repeated environment variable") {
        opts.env_assignments = {"A=1", "A=2"};
        REQUIRE(opts.validate() == "Environment variable \"A\" is given more than once"s);
    }

    SECTION("Baseline environment variable") {
        opts.env_assignments = {"PATH=/tmp"};
        REQUIRE(!opts.validate());
    }
}

TEST_CASE("Verbosity is clamped") {
    ValidOptions valid;

    valid.opts.verbosity = static_cast<VerbosityLevel>(42);
    REQUIRE(valid.opts.validate());
    REQUIRE(valid.opts.verbosity == VerbosityLevel::Max);
}

TEST_CASE("Parsing environment assignments") {
    using Assignment = std::pair<std::string, std::string>;

    REQUIRE(ProgramOptions::parse_env_assignment("A=1") == Assignment{"A", "1"});
    REQUIRE(ProgramOptions::parse_env_assignment("A==") == Assignment{"A", "="});
    REQUIRE(ProgramOptions::parse_env_assignment("=x") == Assignment{"", "x"});
    REQUIRE(!ProgramOptions::parse_env_assignment("A"));
}

TEST_CASE("Reading files") {
    ValidOptions valid;

    REQUIRE(ProgramOptions::read_file(valid.submission) == "print('hi')\n"s);

    auto missing = ProgramOptions::read_file("/nonexistent/file");
    REQUIRE(!missing);
    REQUIRE(missing.error() == std::errc::no_such_file_or_directory);
    REQUIRE(ProgramOptions::describe_read_error("/nonexistent/file", missing.error()) ==
            "Could not read \"/nonexistent/file\": No such file or directory");
}

TEST_CASE("An unreadable stdin file is reported when building the policy") {
    ValidOptions valid;
    valid.opts.stdin_file = "/nonexistent/input.txt";

    REQUIRE(valid.opts.make_policy() == "Could not read \"/nonexistent/input.txt\": No such file or directory"s);
}

TEST_CASE("Verbosity predicates") {
    using enum VerbosityLevel;

    STATIC_REQUIRE(!should_output_submission_line(Silent));
    STATIC_REQUIRE(should_output_submission_line(Quiet));
    STATIC_REQUIRE(!should_output_submission_line(Summary));

    STATIC_REQUIRE(!should_output_submission_block(Quiet));
    STATIC_REQUIRE(should_output_submission_block(Summary));

    STATIC_REQUIRE(!should_output_streams(Summary, true));
    STATIC_REQUIRE(should_output_streams(Summary, false));
    STATIC_REQUIRE(should_output_streams(All, true));
    STATIC_REQUIRE(!should_output_streams(Quiet, false));

    STATIC_REQUIRE(!should_output_imports(All));
    STATIC_REQUIRE(should_output_imports(Extra));

    STATIC_REQUIRE(!should_output_totals(Quiet));
    STATIC_REQUIRE(should_output_totals(Summary));
}
