#pragma once

#include <dockgrader/common/class_traits.hpp>
#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/file_map.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace dockgrader {

/// One isolated execution session: a single container, created by `provision` and released by `destroy`
///
/// `terminate` and `is_alive` may be called from another thread while a command is executing.
/// Infrastructure failures are thrown (see exceptions.hpp); nothing here produces a verdict.
class Environment : NonMovable
{
public:
    /// Creates and starts a container; throws ProvisionError on failure
    Environment(ContainerEngine& engine, const ContainerSpec& spec);

    /// Destroys the container, if that has not been done explicitly
    ~Environment();

    /// Packs ``files`` under ``root_prefix`` and extracts them into ``container_dir``.
    /// Throws ArchiveError if the files cannot be packed, InjectionError if they cannot be copied in.
    void inject(const FileMap& files, const std::string& root_prefix, const std::string& container_dir);

    /// Blocks until ``argv`` finishes; the exit code belongs to the command, not the engine.
    /// Throws EngineError if the engine could not be asked to run the command at all.
    ExecResult execute(const std::vector<std::string>& argv, const std::string& working_dir, const EnvVars& env = {});

    /// Contents of ``path`` inside the environment, std::nullopt if absent (that is not an error)
    std::optional<std::string> fetch_file(const std::string& path);

    /// Asks the engine every time; an environment that cannot be inspected is considered dead
    bool is_alive();

    /// Forcefully stops the whole environment. Idempotent; failures are logged, never thrown.
    void terminate() noexcept;

    /// Releases every engine resource. Further calls are no-ops; failures are logged, never thrown.
    void destroy() noexcept;

    const ContainerId& get_id() const { return id_; }

    bool was_terminated() const { return terminated_; }

private:
    ContainerEngine* engine_;
    ContainerId id_;

    std::atomic<bool> terminated_ = false;
    bool destroyed_ = false;
};

} // namespace dockgrader
