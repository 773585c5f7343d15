#pragma once

#include <dockgrader/common/class_traits.hpp>
#include <dockgrader/common/error_types.hpp>
#include <dockgrader/common/formatters/macros.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dockgrader {

/// Host directory made visible inside a container
struct VolumeBinding
{
    std::string host_path;
    std::string container_path;
    bool read_only = true;
};

/// Everything needed to create a container
struct ContainerSpec
{
    std::string image;
    std::vector<VolumeBinding> volumes;
    bool network_disabled = true;
    /// In the engine's notation, e.g. "64m"
    std::string memory_limit;
};

struct ExecResult
{
    int exit_code{};
    /// stdout and stderr of the command, interleaved
    std::string output;
};

enum class ContainerStatus { Created, Running, Paused, Restarting, Exited, Dead, Unknown };

using ContainerId = std::string;
using EnvVars = std::map<std::string, std::string>;

/// Synchronous client of a container engine
///
/// Isolation, the memory ceiling and the absence of network are all provided by the engine; nothing here
/// re-verifies them. There is no way to cancel a single command running inside a container:
/// `kill` stops the container as a whole.
class ContainerEngine : NonCopyable
{
public:
    virtual ~ContainerEngine() = default;

    /// Creates and starts a detached container which stays alive until killed
    virtual Result<ContainerId> create(const ContainerSpec& spec) = 0;

    /// Blocks until ``argv`` has finished running inside the container
    virtual Result<ExecResult> execute(const ContainerId& id, const std::vector<std::string>& argv,
                                       const std::string& working_dir, const EnvVars& env) = 0;

    /// Extracts the (tar) ``archive`` into directory ``path`` of the container
    virtual Result<void> put_archive(const ContainerId& id, const std::string& path, const std::string& archive) = 0;

    /// Contents of the file at ``path``, or std::nullopt if there is no such file
    virtual Result<std::optional<std::string>> get_file(const ContainerId& id, const std::string& path) = 0;

    /// Live status, queried from the engine every time
    virtual Result<ContainerStatus> status(const ContainerId& id) = 0;

    virtual Result<void> kill(const ContainerId& id) = 0;

    /// Removes the container and everything associated with it, killing it first if needed
    virtual Result<void> remove(const ContainerId& id) = 0;
};

} // namespace dockgrader

FMT_SERIALIZE_ENUM(::dockgrader::ContainerStatus, Created, Running, Paused, Restarting, Exited, Dead, Unknown);
