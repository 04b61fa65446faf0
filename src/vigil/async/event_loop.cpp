#include <vigil/async/event_loop.h>

namespace vigil {

event_loop::event_loop()
    : owned_clock_(new steady_clock_source), clock_(owned_clock_.get())
{
}

event_loop::event_loop(clock_interface& clock) : clock_(&clock)
{
}

timer_id
event_loop::post(std::function<void()> work)
{
    return post_at(clock_->now(), std::move(work));
}

timer_id
event_loop::post_at(time_point when, std::function<void()> work)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    auto id = next_id_++;
    queue_.emplace(std::make_pair(when, id), std::move(work));
    due_times_[id] = when;
    wakeup_.notify_one();
    return id;
}

timer_id
event_loop::post_after(
    std::chrono::milliseconds delay, std::function<void()> work)
{
    return post_at(clock_->now() + delay, std::move(work));
}

bool
event_loop::cancel(timer_id id)
{
    std::scoped_lock<std::mutex> lock(mutex_);
    auto due = due_times_.find(id);
    if (due == due_times_.end())
        return false;
    queue_.erase(std::make_pair(due->second, id));
    due_times_.erase(due);
    return true;
}

std::size_t
event_loop::pending_count() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return queue_.size();
}

bool
event_loop::run_next(bool return_when_idle)
{
    std::function<void()> work;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true)
        {
            if (stopped_)
                return false;
            if (queue_.empty())
            {
                if (return_when_idle)
                    return false;
                wakeup_.wait(lock);
                continue;
            }
            auto next = queue_.begin();
            auto due = next->first.first;
            if (due > clock_->now())
            {
                // Something else may be posted while we wait, so always
                // recheck the queue afterwards.
                clock_->wait_until(lock, wakeup_, due);
                continue;
            }
            work = std::move(next->second);
            due_times_.erase(next->first.second);
            queue_.erase(next);
            break;
        }
    }
    work();
    return true;
}

void
event_loop::run()
{
    while (run_next(false))
        ;
}

void
event_loop::run_until_idle()
{
    while (run_next(true))
        ;
}

void
event_loop::stop()
{
    std::scoped_lock<std::mutex> lock(mutex_);
    stopped_ = true;
    wakeup_.notify_all();
}

void
event_loop::restart()
{
    std::scoped_lock<std::mutex> lock(mutex_);
    stopped_ = false;
}

bool
event_loop::is_stopped() const
{
    std::scoped_lock<std::mutex> lock(mutex_);
    return stopped_;
}

} // namespace vigil
