#pragma once

#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/subprocess/subprocess.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dockgrader {

/// ContainerEngine backed by the `docker` command line client
///
/// Each request spawns one docker CLI process and waits for it.
class DockerCliEngine : public ContainerEngine
{
public:
    explicit DockerCliEngine(std::string docker_exec = std::string{DEFAULT_DOCKER_EXEC});

    /// `docker create` followed by `docker start`; a container that fails to start is removed again
    Result<ContainerId> create(const ContainerSpec& spec) override;
    Result<ExecResult> execute(const ContainerId& id, const std::vector<std::string>& argv,
                               const std::string& working_dir, const EnvVars& env) override;
    Result<void> put_archive(const ContainerId& id, const std::string& path, const std::string& archive) override;
    Result<std::optional<std::string>> get_file(const ContainerId& id, const std::string& path) override;
    Result<ContainerStatus> status(const ContainerId& id) override;
    Result<void> kill(const ContainerId& id) override;
    Result<void> remove(const ContainerId& id) override;

    static constexpr std::string_view DEFAULT_DOCKER_EXEC = "docker";

    /// Maps `docker inspect`'s `.State.Status` onto ContainerStatus
    static ContainerStatus parse_status(std::string_view status_str);

    /// Argument list of `docker create` for ``spec``; exposed for testing
    static std::vector<std::string> make_create_args(const ContainerSpec& spec);

private:
    /// Runs the docker CLI, treating a non-zero exit code as an engine failure
    Result<CommandOutput> docker(const std::vector<std::string>& args, std::string_view input = {},
                                 Subprocess::StderrMode stderr_mode = Subprocess::StderrMode::Capture) const;

    std::string docker_exec_;
};

} // namespace dockgrader
