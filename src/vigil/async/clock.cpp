#include <vigil/async/clock.hpp>

namespace vigil {

time_point
manual_clock::now() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return now_;
}

void
manual_clock::wait_until(
    std::unique_lock<std::mutex>&, std::condition_variable&, time_point deadline)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    if (deadline > now_)
        now_ = deadline;
}

void
manual_clock::advance(std::chrono::milliseconds amount)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    now_ += amount;
}

std::chrono::milliseconds
manual_clock::elapsed() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now_ - start_);
}

} // namespace vigil
