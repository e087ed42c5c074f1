/// @file call_executor.cpp
/// @brief CallExecutor implementation wrapping kcenon thread_system.

#include "cbreak/foundation/call_executor.hpp"

#include "cbreak/foundation/breaker_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <atomic>
#include <exception>
#include <mutex>
#include <vector>

namespace cbreak::foundation {

struct CallExecutor::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string name;
    std::size_t workers{0};
    std::atomic<uint64_t> nextJobId{1};
    std::atomic<uint64_t> completed{0};
    std::atomic<bool> running{false};
    std::mutex lifecycleMutex;
};

CallExecutor::CallExecutor(std::size_t numThreads, std::string name)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->name = std::move(name);
    impl_->workers = numThreads;
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(impl_->name);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
    impl_->running.store(true, std::memory_order_release);
}

CallExecutor::~CallExecutor() {
    if (impl_) {
        shutdown();
    }
}

CallExecutor::CallExecutor(CallExecutor&&) noexcept = default;
CallExecutor& CallExecutor::operator=(CallExecutor&&) noexcept = default;

BreakerResult<void> CallExecutor::post(Job job) {
    if (!impl_->running.load(std::memory_order_acquire)) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::ExecutorStopped, "executor has been shut down"));
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto threadJob = kcenon::thread::job_builder()
        .name(impl_->name + "_call_" + std::to_string(id))
        .work([fn = std::move(job), impl = impl_.get()]()
              -> kcenon::common::VoidResult {
            try {
                fn();
            } catch (const std::exception& e) {
                // Breaker jobs deliver their outcome through a promise; an
                // escaping exception here is a bug in the job itself.
                CBREAK_LOG_ERROR(LogCategory::Core,
                                 std::string("executor job threw: ") + e.what());
            }
            impl->completed.fetch_add(1, std::memory_order_relaxed);
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        return BreakerResult<void>::err(
            BreakerError(ErrorCode::JobScheduleFailed, "failed to enqueue call"));
    }
    return BreakerResult<void>::ok();
}

void CallExecutor::shutdown() {
    std::lock_guard lock(impl_->lifecycleMutex);
    if (!impl_->running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    if (impl_->pool) {
        impl_->pool->stop(false);  // graceful: wait for running jobs
    }
}

bool CallExecutor::isRunning() const {
    return impl_->running.load(std::memory_order_acquire);
}

std::size_t CallExecutor::workerCount() const {
    return impl_->workers;
}

uint64_t CallExecutor::completedCount() const {
    return impl_->completed.load(std::memory_order_relaxed);
}

}  // namespace cbreak::foundation
