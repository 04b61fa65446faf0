#ifndef VIGIL_ASYNC_RUN_H
#define VIGIL_ASYNC_RUN_H

#include <exception>
#include <tuple>

#include <cppcoro/on_scope_exit.hpp>
#include <cppcoro/sync_wait.hpp>
#include <cppcoro/task.hpp>
#include <cppcoro/when_all_ready.hpp>

#include <vigil/async/event_loop.h>

namespace vigil {

// Run :task to completion, driving :loop on the calling thread while it's
// outstanding. The result is whatever the task produces (or the exception it
// throws).
//
// The task is started first, so any work it does before its first suspension
// happens before the loop runs anything else.
//
// If some other unit of work on the loop throws, the loop keeps running until
// the task has finished, and then the first such exception is rethrown in
// place of the task's result.
//
template<class Value>
Value
run_until_complete(event_loop& loop, cppcoro::task<Value> task)
{
    std::exception_ptr loop_error;
    auto results = cppcoro::sync_wait(cppcoro::when_all_ready(
        [&]() -> cppcoro::task<Value> {
            auto stop_loop = cppcoro::on_scope_exit([&] { loop.stop(); });
            co_return co_await std::move(task);
        }(),
        [&]() -> cppcoro::task<> {
            while (true)
            {
                try
                {
                    loop.run();
                    break;
                }
                catch (...)
                {
                    if (!loop_error)
                        loop_error = std::current_exception();
                }
            }
            co_return;
        }()));
    loop.restart();
    if (loop_error)
        std::rethrow_exception(loop_error);
    return std::get<0>(std::move(results)).result();
}

} // namespace vigil

#endif
