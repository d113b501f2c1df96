#include "ExpirySweeper.hpp"

#include <stdexcept>
#include <string>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include "CacheManager.hpp"

ExpirySweeper::ExpirySweeper(net::io_context& ioc,
                             CacheManager& manager,
                             std::chrono::milliseconds interval,
                             std::shared_ptr<ILogger> logger)
    : strand_(net::make_strand(ioc)),
      timer_(strand_),
      manager_(manager),
      interval_(interval),
      logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for ExpirySweeper");
    }
    if (interval_.count() <= 0) {
        throw std::invalid_argument("ExpirySweeper interval must be positive");
    }
}

void ExpirySweeper::start() {
    if (running_.exchange(true)) {
        return; // Already running
    }
    logger_->setup("ExpirySweeper started, interval " + std::to_string(interval_.count()) + "ms");
    net::post(strand_, [self = shared_from_this()]() { self->arm(); });
}

void ExpirySweeper::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    net::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
    logger_->debug("ExpirySweeper stopped after " + std::to_string(sweep_count_.load()) + " sweeps");
}

void ExpirySweeper::arm() {
    if (!running_) {
        return;
    }
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) { self->onTimer(ec); });
}

void ExpirySweeper::onTimer(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || !running_) {
        return;
    }
    if (ec) {
        logger_->error("ExpirySweeper timer error: " + ec.message());
        return;
    }

    try {
        std::size_t removed = manager_.purgeExpired();
        sweep_count_++;
        if (removed > 0 && logger_->isDebugEnabled()) {
            logger_->debug("ExpirySweeper purged " + std::to_string(removed) + " expired entries");
        }
    } catch (const std::exception& e) {
        logger_->error("Exception caught in ExpirySweeper: " + std::string(e.what()));
    }
    arm();
}
