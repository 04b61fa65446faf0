#ifndef VIGIL_ASYNC_SETTLEMENT_HPP
#define VIGIL_ASYNC_SETTLEMENT_HPP

#include <exception>

#include <cppcoro/single_consumer_event.hpp>
#include <cppcoro/task.hpp>

#include <vigil/core/type_definitions.hpp>

namespace vigil {

// A settlement bridges callback-style notifications and coroutines.
// It's settled exactly once, either with a value or with an error. Later
// attempts to settle it are ignored (and report false). A single coroutine
// can await the outcome through result().
//
// Settlements are not thread-safe. They're meant to be settled from work
// running on the same event_loop as the awaiting coroutine.
//
template<class Value>
struct settlement : noncopyable
{
    bool
    is_settled() const
    {
        return settled_;
    }

    bool
    resolve(Value value)
    {
        if (settled_)
            return false;
        settled_ = true;
        value_ = std::move(value);
        ready_.set();
        return true;
    }

    bool
    reject(std::exception_ptr error)
    {
        if (settled_)
            return false;
        settled_ = true;
        error_ = std::move(error);
        ready_.set();
        return true;
    }

    cppcoro::task<Value>
    result()
    {
        co_await ready_;
        if (error_)
            std::rethrow_exception(error_);
        co_return std::move(*value_);
    }

 private:
    bool settled_ = false;
    optional<Value> value_;
    std::exception_ptr error_;
    cppcoro::single_consumer_event ready_;
};

} // namespace vigil

#endif
