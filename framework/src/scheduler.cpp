#include <tripwire/scheduler.h>
#include <boost/asio/error.hpp>

namespace tripwire {

namespace {

class AsioTimer : public Timer, public std::enable_shared_from_this<AsioTimer> {
public:
    AsioTimer(boost::asio::any_io_executor executor, Scheduler::Callback callback)
        : timer_(std::move(executor)), callback_(std::move(callback)) {}

    void arm(Millis delay) {
        timer_.expires_after(delay);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            // Expiry may already be queued when cancel() runs, so the flag decides.
            bool expected = false;
            if (!self->done_.compare_exchange_strong(expected, true)) return;
            auto callback = std::move(self->callback_);
            callback();
        });
    }

    bool cancel() override {
        bool expected = false;
        if (!done_.compare_exchange_strong(expected, true)) return false;
        timer_.cancel();
        return true;
    }

private:
    boost::asio::steady_timer timer_;
    Scheduler::Callback callback_;
    std::atomic<bool> done_{false};
};

} // namespace

AsioScheduler::AsioScheduler(boost::asio::any_io_executor executor)
    : executor_(std::move(executor)) {}

Millis AsioScheduler::now() const {
    return std::chrono::duration_cast<Millis>(
        std::chrono::steady_clock::now().time_since_epoch());
}

std::shared_ptr<Timer> AsioScheduler::schedule(Millis delay, Callback callback) {
    auto timer = std::make_shared<AsioTimer>(executor_, std::move(callback));
    timer->arm(delay);
    return timer;
}

} // namespace tripwire
