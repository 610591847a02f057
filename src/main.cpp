#include <gradebox/logging.hpp>

#include "app/app.hpp"
#include "app/check_app.hpp"
#include "app/run_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <span>
#include <string>

namespace {

[[noreturn]] void terminate_with_trace() {
    fmt::println(stderr, "Terminated unexpectedly");

    std::string stacktrace_str = fmt::to_string(fmt::streamed(boost::stacktrace::stacktrace()));
    fmt::println(stderr, "Stacktrace:\n{}", stacktrace_str.empty() ? " <unavailable>" : stacktrace_str);

    std::abort();
}

} // namespace

int main(int argc, const char* argv[]) {
    using namespace gradebox;

    std::set_terminate(terminate_with_trace);

    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    const ProgramOptions options = parse_args_or_exit(args, App::EXIT_USAGE_ERROR);

    std::unique_ptr<App> app;

    if (options.command == ProgramOptions::Command::Check) {
        app = std::make_unique<CheckApp>(options);
    } else {
        app = std::make_unique<RunApp>(options);
    }

    return app->run();
}
