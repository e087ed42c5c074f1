#pragma once

/// @file call_strategy.hpp
/// @brief Blocking and asynchronous calling conventions over one breaker engine.
///
/// Both strategies hand the guarded operation to the breaker's single
/// execute() engine and differ only in which thread runs it and how the
/// result is delivered.

#include <exception>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

#include "cbreak/core/result.hpp"
#include "cbreak/foundation/breaker_result.hpp"
#include "cbreak/foundation/call_executor.hpp"

namespace cbreak::breaker {

/// Result type of a guarded operation.
template <typename Op>
using OperationResult = std::remove_cvref_t<std::invoke_result_t<Op&>>;

/// Runs the operation on the calling thread and returns its result.
struct BlockingCall {
    template <typename Breaker, typename Op>
    static OperationResult<Op> run(Breaker& breaker, Op&& op) {
        return breaker.execute(op);
    }
};

/// Runs the operation (and all storage I/O) on a CallExecutor worker.
///
/// The returned future is always valid. If the executor refuses the job
/// the future is already satisfied with the scheduling error, and the
/// breaker is not touched. A throw that the breaker lets through (anything
/// not derived from std::exception) is stored in the future and rethrown
/// by get(), as the blocking call would rethrow it.
///
/// The breaker must outlive the returned future.
struct AsyncCall {
    template <typename Breaker, typename Op>
    static std::future<OperationResult<Op>> run(Breaker& breaker,
                                                foundation::CallExecutor& executor,
                                                Op&& op) {
        using R = OperationResult<Op>;

        auto promise = std::make_shared<std::promise<R>>();
        auto future = promise->get_future();

        auto posted = executor.post(
            [&breaker, promise, fn = std::forward<Op>(op)]() mutable {
                try {
                    promise->set_value(breaker.execute(fn));
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            });
        if (posted.hasError()) {
            promise->set_value(R::err(std::move(posted).error()));
        }
        return future;
    }
};

}  // namespace cbreak::breaker
