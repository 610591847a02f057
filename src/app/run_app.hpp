#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace gradebox {

/// `gradebox run`: check and execute every submission, then report how each behaved
class RunApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;
};

} // namespace gradebox
