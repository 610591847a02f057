#include "app/app.hpp"

#include <gradebox/logging.hpp>
#include <gradebox/sandbox/submission.hpp>

#include "grading_session.hpp"
#include "output/serializer.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>

namespace gradebox {

int App::failures_exit_code(int num_failures) {
    return std::clamp(num_failures, 0, MAX_FAILURE_EXIT_CODE);
}

App::LoadResult App::load_submissions(Serializer& serializer) const {
    LoadResult result;
    result.submissions.reserve(OPTS.files.size());

    for (std::size_t i = 0; i < OPTS.files.size(); ++i) {
        const std::string& path = OPTS.files[i];

        auto text = ProgramOptions::read_file(path);
        if (!text) {
            std::string message = ProgramOptions::describe_read_error(path, text.error());
            LOG_DEBUG("Skipping submission: {}", message);
            serializer.on_error(message);
            ++result.num_unreadable;
            continue;
        }

        std::string student_id = std::filesystem::path{path}.stem().string();

        SubmissionInfo info{.index = i, .path = path, .student_id = student_id};
        SubmissionSource source{std::move(text).value(), OPTS.assignment_name, std::move(student_id)};

        result.submissions.push_back({std::move(info), std::move(source)});
    }

    return result;
}

} // namespace gradebox
