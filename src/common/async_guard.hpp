#pragma once

#include <boost/asio.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <utility>

namespace rcp {

namespace net = boost::asio;

/**
 * AsyncGuard - exclusive ownership of a resource across coroutines.
 *
 * A capacity-1 channel: lock() sends a token and suspends while another
 * holder owns the slot; unlock() takes the token back out. Waiters resume
 * in FIFO order.
 */
class AsyncGuard {
public:
    explicit AsyncGuard(net::any_io_executor ex) : slot_(ex, 1) {}

    AsyncGuard(const AsyncGuard&) = delete;
    AsyncGuard& operator=(const AsyncGuard&) = delete;

    class Lock {
    public:
        Lock() = default;
        explicit Lock(AsyncGuard* guard) : guard_(guard) {}
        Lock(Lock&& other) noexcept : guard_(std::exchange(other.guard_, nullptr)) {}
        Lock& operator=(Lock&& other) noexcept {
            if (this != &other) {
                release();
                guard_ = std::exchange(other.guard_, nullptr);
            }
            return *this;
        }
        ~Lock() { release(); }

        void release() {
            if (guard_) {
                guard_->unlock();
                guard_ = nullptr;
            }
        }

        bool owns() const { return guard_ != nullptr; }

    private:
        AsyncGuard* guard_ = nullptr;
    };

    // Suspends until the slot is free. Returns an empty Lock once the
    // guard has been closed.
    net::awaitable<Lock> lock() {
        auto [ec] = co_await slot_.async_send(
            boost::system::error_code{}, net::as_tuple(net::use_awaitable));
        if (ec) {
            co_return Lock{};
        }
        co_return Lock{this};
    }

    // Wake every waiter with an empty Lock
    void close() { slot_.close(); }

private:
    void unlock() {
        slot_.try_receive([](boost::system::error_code) {});
    }

    net::experimental::concurrent_channel<void(boost::system::error_code)> slot_;
};

} // namespace rcp
