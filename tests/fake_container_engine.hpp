#pragma once

#include <dockgrader/common/error_types.hpp>
#include <dockgrader/container/container_engine.hpp>

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dockgrader::testing {

/// In-memory ContainerEngine driven by test-provided callbacks
///
/// Commands are answered by `on_execute`; files inside the "container" are set with `set_file`. Killing the container
/// wakes any command blocked in `block_until_killed`, the way `docker kill` makes a running `docker exec` return.
class FakeContainerEngine : public ContainerEngine
{
public:
    using ExecHandler = std::function<ExecResult(const std::vector<std::string>& argv, const EnvVars& env)>;

    ExecHandler on_execute = [](const auto& /*argv*/, const auto& /*env*/) { return ExecResult{}; };

    bool fail_create = false;
    bool fail_put_archive = false;
    bool fail_kill = false;

    Result<ContainerId> create(const ContainerSpec& spec) override {
        std::scoped_lock lock{mutex_};
        log_.push_back("create");

        if (fail_create) {
            return ErrorKind::EngineFailure;
        }

        spec_ = spec;
        status_ = ContainerStatus::Running;

        return ContainerId{"fakecontainer0123456789"};
    }

    Result<ExecResult> execute(const ContainerId& /*id*/, const std::vector<std::string>& argv,
                               const std::string& working_dir, const EnvVars& env) override {
        {
            std::scoped_lock lock{mutex_};
            log_.push_back("execute");
            executed_.push_back(argv);
            working_dirs_.push_back(working_dir);

            if (status_ != ContainerStatus::Running) {
                return ErrorKind::EngineFailure;
            }
        }

        return on_execute(argv, env);
    }

    Result<void> put_archive(const ContainerId& /*id*/, const std::string& path, const std::string& archive) override {
        std::scoped_lock lock{mutex_};
        log_.push_back("put_archive");

        if (fail_put_archive) {
            return ErrorKind::EngineFailure;
        }

        archive_path_ = path;
        archive_ = archive;

        return {};
    }

    Result<std::optional<std::string>> get_file(const ContainerId& /*id*/, const std::string& path) override {
        std::scoped_lock lock{mutex_};
        log_.push_back("get_file");

        if (auto iter = files_.find(path); iter != files_.end()) {
            return std::optional<std::string>{iter->second};
        }

        return std::optional<std::string>{};
    }

    Result<ContainerStatus> status(const ContainerId& /*id*/) override {
        std::scoped_lock lock{mutex_};
        log_.push_back("status");

        return status_;
    }

    Result<void> kill(const ContainerId& /*id*/) override {
        {
            std::scoped_lock lock{mutex_};
            log_.push_back("kill");

            if (fail_kill) {
                return ErrorKind::EngineFailure;
            }

            status_ = ContainerStatus::Exited;
        }
        killed_cv_.notify_all();

        return {};
    }

    Result<void> remove(const ContainerId& /*id*/) override {
        {
            std::scoped_lock lock{mutex_};
            log_.push_back("remove");
            status_ = ContainerStatus::Dead;
        }
        killed_cv_.notify_all();

        return {};
    }

    // ###### Helpers for ExecHandlers

    /// Simulates a command that never finishes on its own
    ExecResult block_until_killed() {
        std::unique_lock lock{mutex_};
        killed_cv_.wait(lock, [this] { return status_ != ContainerStatus::Running; });

        return ExecResult{.exit_code = 137, .output = ""};
    }

    /// Simulates the engine killing the container from the outside (e.g. memory limit)
    void crash() {
        std::scoped_lock lock{mutex_};
        status_ = ContainerStatus::Exited;
    }

    void set_file(const std::string& path, std::string contents) {
        std::scoped_lock lock{mutex_};
        files_[path] = std::move(contents);
    }

    void remove_file(const std::string& path) {
        std::scoped_lock lock{mutex_};
        files_.erase(path);
    }

    /// Contents of ``filename`` in the first host directory bound into the container
    std::string read_mounted(const std::string& filename) const {
        std::filesystem::path host_path;
        {
            std::scoped_lock lock{mutex_};
            host_path = spec_.volumes.at(0).host_path;
        }

        std::ifstream file{host_path / filename, std::ios::binary};
        return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    }

    // ###### Inspection

    std::vector<std::string> get_log() const {
        std::scoped_lock lock{mutex_};
        return log_;
    }

    std::size_t count(const std::string& call) const {
        std::scoped_lock lock{mutex_};
        return static_cast<std::size_t>(std::count(log_.begin(), log_.end(), call));
    }

    std::vector<std::vector<std::string>> get_executed() const {
        std::scoped_lock lock{mutex_};
        return executed_;
    }

    std::vector<std::string> get_working_dirs() const {
        std::scoped_lock lock{mutex_};
        return working_dirs_;
    }

    ContainerSpec get_spec() const {
        std::scoped_lock lock{mutex_};
        return spec_;
    }

    std::string get_archive() const {
        std::scoped_lock lock{mutex_};
        return archive_;
    }

    std::string get_archive_path() const {
        std::scoped_lock lock{mutex_};
        return archive_path_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable killed_cv_;

    ContainerStatus status_ = ContainerStatus::Created;
    ContainerSpec spec_;

    std::map<std::string, std::string> files_;
    std::string archive_path_;
    std::string archive_;

    std::vector<std::string> log_;
    std::vector<std::vector<std::string>> executed_;
    std::vector<std::string> working_dirs_;
};

} // namespace dockgrader::testing
