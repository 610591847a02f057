#include "output/stdout_sink.hpp"

#include <gradebox/logging.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <string_view>

namespace gradebox {

void StdoutSink::write(std::string_view str) {
    fmt::print(stdout, "{}", str);
}

void StdoutSink::flush() {
    if (std::fflush(stdout) != 0) {
        LOG_WARN("Could not flush stdout: '{}'", get_err_msg());
    }
}

} // namespace gradebox
