#include "catch2_custom.hpp"

#include <gradebox/sandbox/environment.hpp>
#include <gradebox/sandbox/submission.hpp>

#include <map>
#include <string>
#include <vector>

#include <stdlib.h>

using namespace gradebox;

TEST_CASE("The baseline environment is fixed") {
    const EnvironmentMap env = build_environment(ExecutionPolicy{});

    REQUIRE(env == EnvironmentMap{{"HOME", "/nonexistent"},
                                  {"LANG", "C.UTF-8"},
                                  {"LC_ALL", "C.UTF-8"},
                                  {"PATH", "/usr/local/bin:/usr/bin:/bin"}});
}

TEST_CASE("Nothing is inherited from the current process") {
    REQUIRE(::setenv("GRADEBOX_TEST_SECRET", "hunter2", 1) == 0);

    const EnvironmentMap env = build_environment(ExecutionPolicy{});

    REQUIRE(!env.contains("GRADEBOX_TEST_SECRET"));
    REQUIRE(env.at("HOME") == BASELINE_HOME);

    REQUIRE(::unsetenv("GRADEBOX_TEST_SECRET") == 0);
}

TEST_CASE("Extra variables are added on top of the baseline") {
    ExecutionPolicy policy;
    policy.extra_environment = {{"MPLBACKEND", "Agg"}, {"PYTHONHASHSEED", "0"}};

    const EnvironmentMap env = build_environment(policy);

    REQUIRE(env.size() == 6);
    REQUIRE(env.at("MPLBACKEND") == "Agg");
    REQUIRE(env.at("PYTHONHASHSEED") == "0");
}

TEST_CASE("Extra variables never override the baseline") {
    ExecutionPolicy policy;
    policy.extra_environment = {{"PATH", "/tmp/evil"}};

    REQUIRE(build_environment(policy).at("PATH") == BASELINE_PATH);
}

TEST_CASE("Validating extra variables") {
    using Env = std::map<std::string, std::string>;

    REQUIRE(validate_extra_environment({}));
    REQUIRE(validate_extra_environment(Env{{"MPLBACKEND", "Agg"}, {"EMPTY", ""}}));

    REQUIRE(validate_extra_environment(Env{{"", "x"}}).error() == "environment variable names must not be empty");
    REQUIRE(validate_extra_environment(Env{{"A=B", "x"}}).error() ==
            "environment variable name \"A=B\" must not contain '='");
    REQUIRE(validate_extra_environment(Env{{"A", std::string{"x\0y", 3}}}).error() ==
            "environment variable \"A\" must not contain NUL bytes");
    REQUIRE(validate_extra_environment(Env{{"LC_ALL", "C"}}).error() ==
            "environment variable \"LC_ALL\" is fixed by the sandbox and cannot be overridden");
}

TEST_CASE("Baseline variable names") {
    REQUIRE(is_baseline_variable("PATH"));
    REQUIRE(is_baseline_variable("HOME"));
    REQUIRE(!is_baseline_variable("path"));
    REQUIRE(!is_baseline_variable("PYTHONPATH"));
}

TEST_CASE("Environment strings are KEY=VALUE in name order") {
    ExecutionPolicy policy;
    policy.extra_environment = {{"ANSWER", "4=2"}};

    REQUIRE(to_env_strings(build_environment(policy)) ==
            std::vector<std::string>{"ANSWER=4=2", "HOME=/nonexistent", "LANG=C.UTF-8", "LC_ALL=C.UTF-8",
                                     "PATH=/usr/local/bin:/usr/bin:/bin"});
}
