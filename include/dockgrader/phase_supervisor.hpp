#pragma once

#include <dockgrader/container/environment.hpp>
#include <dockgrader/exceptions.hpp>
#include <dockgrader/grading_result.hpp>
#include <dockgrader/logging.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <gsl/util>

#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace dockgrader {

/// What became of one supervised phase
template <typename T>
struct PhaseOutcome
{
    /// Empty iff the phase did not complete within its budget
    std::optional<T> value;
    Seconds elapsed{};
    bool completed = false;
};

/// Runs one phase (build or test) against an Environment under a hard wall-clock budget
///
/// The work runs on a worker thread while the calling thread waits on its future. If the budget expires,
/// the only cancellation available is to terminate the whole environment: the worker's blocking call into
/// the environment then returns (or fails) and the worker is joined before `supervise` returns, so no
/// worker ever outlives its phase. The result of an abandoned worker is discarded.
///
/// Exceptions thrown by work that completes in time are rethrown to the caller.
class PhaseSupervisor
{
public:
    PhaseSupervisor(Environment& env, std::string phase_name)
        : env_{&env}
        , name_{std::move(phase_name)} {}

    template <typename Fn, typename T = std::invoke_result_t<Fn&>>
    PhaseOutcome<T> supervise(Seconds budget, Fn work) {
        static_assert(!std::is_void_v<T>, "A supervised phase must produce an outcome");

        std::packaged_task<T()> task{std::move(work)};
        std::future<T> future = task.get_future();

        LOG_DEBUG("Starting {} phase (budget {})", name_, budget);

        const auto start = std::chrono::steady_clock::now();
        std::thread worker{std::move(task)};

        // Rendezvous on every path out of here, including exceptional ones
        auto join_worker = gsl::finally([&worker] { worker.join(); });

        const bool in_time = future.wait_for(budget) == std::future_status::ready;
        const Seconds elapsed = std::chrono::steady_clock::now() - start;

        if (in_time) {
            LOG_DEBUG("{} phase completed in {}", name_, elapsed);
            return {.value = future.get(), .elapsed = elapsed, .completed = true};
        }

        LOG_INFO("{} phase exceeded its budget of {}", name_, budget);

        env_->terminate();

        // Blocks until the worker has unwound; join_worker then reaps the thread
        discard_abandoned(future);

        return {.value = std::nullopt, .elapsed = elapsed, .completed = false};
    }

private:
    template <typename T>
    void discard_abandoned(std::future<T>& future) const {
        // Once the environment has been terminated, the worker most likely failed talking to it
        try {
            static_cast<void>(future.get());
        } catch (const GradingInfrastructureError& ex) {
            LOG_DEBUG("Abandoned {} phase ended with: {}", name_, ex);
        }
    }

    Environment* env_;
    std::string name_;
};

} // namespace dockgrader
