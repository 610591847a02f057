#pragma once

#include "app/app.hpp" // IWYU pragma: export

namespace gradebox {

/// `gradebox check`: report each submission's import verdict without executing anything
class CheckApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;
};

} // namespace gradebox
