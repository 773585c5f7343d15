#include "app/app.hpp"
#include "app/grader_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <dockgrader/logging.hpp>

#include <cstddef>
#include <span>

int main(int argc, const char* argv[]) {
    dockgrader::init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    dockgrader::GraderApp app{dockgrader::parse_args_or_exit(args, dockgrader::EXIT_NOT_GRADED)};

    return app.run();
}
