#include <dockgrader/container/environment.hpp>

#include <dockgrader/archive/tar_writer.hpp>
#include <dockgrader/common/error_types.hpp>
#include <dockgrader/container/container_engine.hpp>
#include <dockgrader/exceptions.hpp>
#include <dockgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <optional>
#include <string>
#include <vector>

namespace dockgrader {

Environment::Environment(ContainerEngine& engine, const ContainerSpec& spec)
    : engine_{&engine} {
    auto id = engine_->create(spec);

    if (!id) {
        throw ProvisionError(fmt::format("Unable to create a container from image {:?}", spec.image), id.error());
    }

    id_ = std::move(id.value());

    LOG_INFO("Provisioned container {:.12} (image={}, memory={}, network={})", id_, spec.image, spec.memory_limit,
             spec.network_disabled ? "none" : "default");
}

Environment::~Environment() {
    destroy();
}

void Environment::inject(const FileMap& files, const std::string& root_prefix, const std::string& container_dir) {
    std::string archive;

    try {
        archive = DEBUG_TIME(pack_tar(files, root_prefix));
    } catch (const ArchiveError& ex) {
        LOG_ERROR("Unable to pack submission: {}", ex.what());
        throw;
    }

    if (auto res = engine_->put_archive(id_, container_dir, archive); !res) {
        throw InjectionError(fmt::format("Unable to create requested filesystem in {:?}", container_dir), res.error());
    }

    LOG_DEBUG("[{:.12}] injected {} files under {}/{}", id_, files.size(), container_dir, root_prefix);
}

ExecResult Environment::execute(const std::vector<std::string>& argv, const std::string& working_dir,
                                const EnvVars& env) {
    auto res = engine_->execute(id_, argv, working_dir, env);

    if (!res) {
        throw EngineError(fmt::format("Unable to execute {} in container {:.12}", argv, id_), res.error());
    }

    LOG_TRACE("[{:.12}] exit code {}, output {:?}", id_, res->exit_code, res->output);

    return std::move(res.value());
}

std::optional<std::string> Environment::fetch_file(const std::string& path) {
    auto res = engine_->get_file(id_, path);

    if (!res) {
        throw EngineError(fmt::format("Unable to fetch {:?} from container {:.12}", path, id_), res.error());
    }

    return std::move(res.value());
}

bool Environment::is_alive() {
    auto res = engine_->status(id_);

    if (!res) {
        LOG_WARN("Could not query status of container {:.12} ({}); treating it as dead", id_, res.error());
        return false;
    }

    // Anything but running (paused, restarting, exited, ...) counts as dead
    return res.value() == ContainerStatus::Running;
}

void Environment::terminate() noexcept {
    if (terminated_.exchange(true)) {
        return;
    }

    LOG_INFO("Terminating container {:.12}", id_);

    if (auto res = engine_->kill(id_); !res) {
        // The session is already failing at this point; removal in destroy() still forces it down
        LOG_WARN("Could not kill container {:.12}: {}", id_, res.error());
    }
}

void Environment::destroy() noexcept {
    if (destroyed_) {
        return;
    }
    destroyed_ = true;

    if (auto res = engine_->remove(id_); !res) {
        LOG_ERROR("Could not remove container {:.12}: {}", id_, res.error());
        return;
    }

    LOG_DEBUG("Removed container {:.12}", id_);
}

} // namespace dockgrader
