#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "output/serializer.hpp"
#include "output/sink.hpp"

#include <memory>

namespace dockgrader {

/// Grades the submission named on the command line with the docker CLI and reports the result
class GraderApp final : public App
{
public:
    using App::App;

private:
    int run_impl() override;

    std::unique_ptr<Serializer> make_serializer(Sink& sink) const;
};

} // namespace dockgrader
