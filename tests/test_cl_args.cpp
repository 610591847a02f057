#include "catch2_custom.hpp"

#include <gradebox/subprocess/scratch_dir.hpp>

#include "output/verbosity.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

using namespace gradebox;
using namespace std::literals;

namespace {

class ArgsFixture
{
public:
    ArgsFixture() {
        auto dir = ScratchDir::create();
        REQUIRE(dir);
        scratch_.emplace(std::move(dir).value());

        auto first = scratch_->write_file("alice.py", "print(1)\n");
        auto second = scratch_->write_file("bob.py", "print(2)\n");
        REQUIRE(first);
        REQUIRE(second);
        alice = *first;
        bob = *second;
    }

    /// Parse `gradebox <args...>`
    Expected<ProgramOptions, std::string> parse(std::initializer_list<std::string> args) {
        storage_ = {"/usr/local/bin/gradebox"};
        storage_.insert(storage_.end(), args.begin(), args.end());

        argv_.clear();
        for (const std::string& arg : storage_) {
            argv_.push_back(arg.c_str());
        }

        CommandLineArgs cl_args{std::span{argv_}};
        return cl_args.parse();
    }

    std::string alice;
    std::string bob;

private:
    std::optional<ScratchDir> scratch_;
    std::vector<std::string> storage_;
    std::vector<const char*> argv_;
};

} // namespace

TEST_CASE_METHOD(ArgsFixture, "Run with defaults") {
    auto opts = parse({"run", alice, bob});
    REQUIRE(opts);

    REQUIRE(opts->command == ProgramOptions::Command::Run);
    REQUIRE(opts->files == std::vector{alice, bob});
    REQUIRE(opts->verbosity == VerbosityLevel::Summary);
    REQUIRE(opts->colorize_option == ProgramOptions::ColorizeOpt::Auto);
    REQUIRE(opts->assignment_name == "cli");
    REQUIRE(opts->timeout_seconds == 10);
    REQUIRE(opts->max_output_bytes == 2000);
    REQUIRE(opts->interpreter == "/usr/bin/python3");
    REQUIRE(opts->allowed_imports.empty());
    REQUIRE(!opts->stdin_file);
    REQUIRE(opts->env_assignments.empty());
    REQUIRE(!opts->strip_ansi);
    REQUIRE(opts->jobs == 1);
}

TEST_CASE_METHOD(ArgsFixture, "Run with every option") {
    auto opts = parse({"run", "-t", "5", "--max-output", "100", "--interpreter", "/usr/bin/python3.12", "--stdin", bob,
                       "-e", "A=1", "--env", "B=2", "--strip-ansi", "-j", "4", "--assignment", "hw3", "-c", "never",
                       "-a", "math, json", "--allow", "re", alice});
    REQUIRE(opts);

    REQUIRE(opts->timeout_seconds == 5);
    REQUIRE(opts->max_output_bytes == 100);
    REQUIRE(opts->interpreter == "/usr/bin/python3.12");
    REQUIRE(opts->stdin_file == bob);
    REQUIRE(opts->env_assignments == std::vector<std::string>{"A=1", "B=2"});
    REQUIRE(opts->strip_ansi);
    REQUIRE(opts->jobs == 4);
    REQUIRE(opts->assignment_name == "hw3");
    REQUIRE(opts->colorize_option == ProgramOptions::ColorizeOpt::Never);
    REQUIRE(opts->allowed_imports == std::vector<std::string>{"math", "json", "re"});
    REQUIRE(opts->files == std::vector{alice});
}

TEST_CASE_METHOD(ArgsFixture, "Check command") {
    auto opts = parse({"check", "-q", alice});
    REQUIRE(opts);

    REQUIRE(opts->command == ProgramOptions::Command::Check);
    REQUIRE(opts->verbosity == VerbosityLevel::Quiet);
}

TEST_CASE_METHOD(ArgsFixture, "Verbosity flags stack") {
    REQUIRE(parse({"run", "-v", alice})->verbosity == VerbosityLevel::All);
    REQUIRE(parse({"run", "-v", "-v", alice})->verbosity == VerbosityLevel::Extra);
    REQUIRE(parse({"run", "-q", "-q", alice})->verbosity == VerbosityLevel::Silent);

    REQUIRE(!parse({"run", "-v", "-v", "-v", alice}));
    REQUIRE(!parse({"run", "-q", "-q", "-q", alice}));
}

TEST_CASE_METHOD(ArgsFixture, "Usage errors") {
    REQUIRE(!parse({}));
    REQUIRE(!parse({"run"}));
    REQUIRE(!parse({"grade", alice}));
    REQUIRE(!parse({"run", "-t", "soon", alice}));

    // run-only options are not accepted by check
    REQUIRE(!parse({"check", "-t", "5", alice}));

    REQUIRE(parse({"run", "/nonexistent/carol.py"}).error() == "Submission file \"/nonexistent/carol.py\" does not exist");
    REQUIRE(parse({"run", "-t", "0", alice}).error() == "max_seconds must be in [1, 3600], got 0");
    REQUIRE(parse({"run", "-e", "NOVALUE", alice}).error() ==
            "Environment assignment \"NOVALUE\" is not of the form KEY=VALUE");
    REQUIRE(parse({"run", "-e", "HOME=/root", alice}).error() ==
            "environment variable \"HOME\" is fixed by the sandbox and cannot be overridden");
}
