#ifndef EXPIRYSWEEPER_HPP
#define EXPIRYSWEEPER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include "../interfaces/ILogger.hpp"

namespace net = boost::asio;

class CacheManager;

// Periodically purges expired entries from every store of a manager, so that
// entries nobody reads again do not linger until LRU pushes them out.
// Timer handlers run on the io_context threads and keep the sweeper alive, so it
// must be owned by a std::shared_ptr.
class ExpirySweeper : public std::enable_shared_from_this<ExpirySweeper> {
public:
    ExpirySweeper(net::io_context& ioc,
                  CacheManager& manager,
                  std::chrono::milliseconds interval,
                  std::shared_ptr<ILogger> logger);
    ~ExpirySweeper() = default;

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void start();
    // Safe to call from any thread, idempotent
    void stop();

    bool isRunning() const { return running_.load(); }
    std::uint64_t sweepCount() const { return sweep_count_.load(); }

private:
    void arm();
    void onTimer(const boost::system::error_code& ec);

    net::strand<net::io_context::executor_type> strand_; // Serializes every touch of timer_
    net::steady_timer timer_;
    CacheManager& manager_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<ILogger> logger_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> sweep_count_{0};
};

#endif // EXPIRYSWEEPER_HPP
