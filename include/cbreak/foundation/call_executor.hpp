#pragma once

/// @file call_executor.hpp
/// @brief CallExecutor wrapping kcenon thread_system for asynchronous breaker calls.

#include "cbreak/foundation/breaker_result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace cbreak::foundation {

/// Worker pool that runs asynchronous breaker calls off the caller's thread.
///
/// Wraps kcenon's thread_system thread_pool behind PIMPL so the public
/// header does not leak thread_system includes. A single executor is
/// normally shared by every breaker of a process.
///
/// Example:
/// @code
///   CallExecutor executor(4);
///   auto future = breaker.callAsync(executor, [] { return fetchQuote(); });
///   auto result = future.get();
/// @endcode
class CallExecutor {
public:
    using Job = std::function<void()>;

    /// Construct an executor backed by @p numThreads workers.
    explicit CallExecutor(std::size_t numThreads = std::thread::hardware_concurrency(),
                          std::string name = "cbreak-executor");

    /// Stops the pool, letting already running jobs finish.
    ~CallExecutor();

    // Non-copyable, movable.
    CallExecutor(const CallExecutor&) = delete;
    CallExecutor& operator=(const CallExecutor&) = delete;
    CallExecutor(CallExecutor&&) noexcept;
    CallExecutor& operator=(CallExecutor&&) noexcept;

    /// Queue a job for execution on a worker thread.
    /// @return ExecutorStopped after shutdown(), JobScheduleFailed if the
    ///         pool refused the job.
    BreakerResult<void> post(Job job);

    /// Stop accepting jobs and join the workers.
    void shutdown();

    /// True until shutdown() has been called.
    [[nodiscard]] bool isRunning() const;

    /// Number of worker threads.
    [[nodiscard]] std::size_t workerCount() const;

    /// Number of jobs that have finished running.
    [[nodiscard]] uint64_t completedCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cbreak::foundation
