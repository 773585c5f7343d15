#include <dockgrader/container/docker_cli_engine.hpp>

#include <dockgrader/common/error_types.hpp>
#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/logging.hpp>
#include <dockgrader/subprocess/subprocess.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/find_if.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dockgrader {

namespace {

std::string_view trim(std::string_view str) {
    constexpr std::string_view WHITESPACE = " \t\r\n";

    auto first = str.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = str.find_last_not_of(WHITESPACE);

    return str.substr(first, last - first + 1);
}

} // namespace

DockerCliEngine::DockerCliEngine(std::string docker_exec)
    : docker_exec_{std::move(docker_exec)} {}

std::vector<std::string> DockerCliEngine::make_create_args(const ContainerSpec& spec) {
    std::vector<std::string> args{"create", "--tty"};

    if (spec.network_disabled) {
        args.insert(args.end(), {"--network", "none"});
    }

    if (!spec.memory_limit.empty()) {
        args.insert(args.end(), {"--memory", spec.memory_limit});
    }

    for (const VolumeBinding& volume : spec.volumes) {
        args.push_back("--volume");
        args.push_back(
            fmt::format("{}:{}:{}", volume.host_path, volume.container_path, volume.read_only ? "ro" : "rw"));
    }

    args.push_back(spec.image);

    return args;
}

Result<ContainerId> DockerCliEngine::create(const ContainerSpec& spec) {
    CommandOutput res = TRY(docker(make_create_args(spec)));

    ContainerId id{trim(res.out)};

    if (id.empty()) {
        LOG_WARN("docker create succeeded, but did not report a container id");
        return ErrorKind::EngineFailure;
    }

    // A container that was created but could not be started must not outlive this call
    if (auto started = docker({"start", id}); !started) {
        LOG_ERROR("Could not start container {:.12}; removing it", id);

        if (auto removed = remove(id); !removed) {
            LOG_ERROR("Could not remove unstarted container {:.12}: {}", id, removed.error());
        }

        return started.error();
    }

    return id;
}

Result<ExecResult> DockerCliEngine::execute(const ContainerId& id, const std::vector<std::string>& argv,
                                            const std::string& working_dir, const EnvVars& env) {
    std::vector<std::string> args{"exec"};

    if (!working_dir.empty()) {
        args.insert(args.end(), {"--workdir", working_dir});
    }

    for (const auto& [key, value] : env) {
        args.push_back("--env");
        args.push_back(fmt::format("{}={}", key, value));
    }

    args.push_back(id);
    args.insert(args.end(), argv.begin(), argv.end());

    LOG_DEBUG("[{:.12}] exec {}", id, argv);

    // A non-zero exit code here is the command's own, so it is not an engine failure
    CommandOutput res = TRY(run_command(docker_exec_, args, {}, Subprocess::StderrMode::Merge));

    return ExecResult{.exit_code = res.exit_code, .output = std::move(res.out)};
}

Result<void> DockerCliEngine::put_archive(const ContainerId& id, const std::string& path, const std::string& archive) {
    LOG_DEBUG("[{:.12}] extracting {} byte archive into {:?}", id, archive.size(), path);

    TRY(docker({"cp", "-", fmt::format("{}:{}", id, path)}, archive));

    return {};
}

Result<std::optional<std::string>> DockerCliEngine::get_file(const ContainerId& id, const std::string& path) {
    CommandOutput res = TRY(run_command(docker_exec_, {"exec", id, "cat", path}));

    if (res.exit_code != 0) {
        LOG_DEBUG("[{:.12}] no file {:?}: {}", id, path, trim(res.err));
        return std::optional<std::string>{};
    }

    return std::optional<std::string>{std::move(res.out)};
}

Result<ContainerStatus> DockerCliEngine::status(const ContainerId& id) {
    CommandOutput res = TRY(docker({"inspect", "--format", "{{.State.Status}}", id}));

    return parse_status(trim(res.out));
}

Result<void> DockerCliEngine::kill(const ContainerId& id) {
    LOG_DEBUG("[{:.12}] kill", id);

    TRY(docker({"kill", id}));

    return {};
}

Result<void> DockerCliEngine::remove(const ContainerId& id) {
    LOG_DEBUG("[{:.12}] remove", id);

    TRY(docker({"rm", "--force", "--volumes", id}));

    return {};
}

ContainerStatus DockerCliEngine::parse_status(std::string_view status_str) {
    using enum ContainerStatus;

    static constexpr std::array<std::pair<std::string_view, ContainerStatus>, 6> STATUS_NAMES{{
        {"created", Created},
        {"running", Running},
        {"paused", Paused},
        {"restarting", Restarting},
        {"exited", Exited},
        {"dead", Dead},
    }};

    auto iter = ranges::find_if(STATUS_NAMES, [status_str](const auto& pair) { return pair.first == status_str; });

    if (iter == STATUS_NAMES.end()) {
        LOG_WARN("Unrecognized container status {:?}", status_str);
        return Unknown;
    }

    return iter->second;
}

Result<CommandOutput> DockerCliEngine::docker(const std::vector<std::string>& args, std::string_view input,
                                              Subprocess::StderrMode stderr_mode) const {
    auto res = run_command(docker_exec_, args, input, stderr_mode);

    if (!res) {
        LOG_ERROR("Could not run {} {}: {}", docker_exec_, args.front(), res.error());
        return res.error();
    }

    if (res->exit_code != 0) {
        LOG_WARN("{} {} failed with exit code {}: {}", docker_exec_, args.front(), res->exit_code, trim(res->err));
        return ErrorKind::EngineFailure;
    }

    return res;
}

} // namespace dockgrader
