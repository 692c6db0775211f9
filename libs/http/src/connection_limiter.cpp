#include "rio/http/connection_limiter.h"

#include <kj/debug.h>

namespace rio::http {

// ============================================================================
// ConnectionLimiter::Slot
// ============================================================================

ConnectionLimiter::Slot::~Slot() noexcept(false) {
  if (limiter_ != nullptr) {
    limiter_->release();
  }
}

ConnectionLimiter::Slot& ConnectionLimiter::Slot::operator=(Slot&& other) noexcept(false) {
  if (this != &other) {
    if (limiter_ != nullptr) {
      limiter_->release();
    }
    limiter_ = other.limiter_;
    other.limiter_ = nullptr;
  }
  return *this;
}

// ============================================================================
// ConnectionLimiter
// ============================================================================

ConnectionLimiter::ConnectionLimiter(size_t maxConnections) : capacity_(maxConnections) {
  KJ_REQUIRE(capacity_ > 0, "connection budget must be positive");
}

ConnectionLimiter::~ConnectionLimiter() noexcept(false) {
  if (active_ > 0) {
    KJ_LOG(WARNING, "connection limiter destroyed with slots in use", active_);
  }
}

kj::Promise<ConnectionLimiter::Slot> ConnectionLimiter::acquire() {
  if (active_ < capacity_) {
    ++active_;
    return Slot(*this);
  }

  auto paf = kj::newPromiseAndFulfiller<Slot>();
  waiters_.push_back(kj::mv(paf.fulfiller));
  return kj::mv(paf.promise);
}

size_t ConnectionLimiter::waiting() const {
  size_t count = 0;
  for (const auto& waiter : waiters_) {
    if (waiter->isWaiting()) {
      ++count;
    }
  }
  return count;
}

void ConnectionLimiter::release() {
  while (!waiters_.empty()) {
    auto next = kj::mv(waiters_.front());
    waiters_.pop_front();
    if (next->isWaiting()) {
      // Stays counted in active_; the Slot travels with the promise
      next->fulfill(Slot(*this));
      return;
    }
  }
  KJ_ASSERT(active_ > 0);
  --active_;
}

// ============================================================================
// ConnectionAcceptor
// ============================================================================

void ConnectionAcceptor::TaskErrorHandler::taskFailed(kj::Exception&& exception) {
  if (exception.getType() == kj::Exception::Type::DISCONNECTED) {
    KJ_LOG(INFO, "client disconnected", exception.getDescription());
  } else {
    KJ_LOG(ERROR, "connection failed", exception);
  }
}

ConnectionAcceptor::ConnectionAcceptor(kj::ConnectionReceiver& receiver, kj::Timer& timer,
                                       kj::HttpServer& server, ConnectionLimiter& limiter,
                                       kj::Maybe<RejectionListener&> listener)
    : receiver_(receiver), timer_(timer), server_(server), limiter_(limiter), listener_(listener),
      tasks_(taskErrorHandler_) {}

bool ConnectionAcceptor::is_retryable(const kj::Exception& exception) {
  auto type = exception.getType();
  return type == kj::Exception::Type::OVERLOADED || type == kj::Exception::Type::DISCONNECTED;
}

kj::Promise<void> ConnectionAcceptor::run() {
  for (;;) {
    auto slot = co_await limiter_.acquire();
    auto accepted = co_await try_accept();
    KJ_IF_SOME(connection, accepted) {
      ++accepted_;
      tasks_.add(serve(kj::mv(connection), kj::mv(slot)));
    }
    else {
      slot = ConnectionLimiter::Slot();
      co_await timer_.afterDelay(ACCEPT_RETRY_DELAY);
    }
  }
}

kj::Promise<kj::Maybe<kj::Own<kj::AsyncIoStream>>> ConnectionAcceptor::try_accept() {
  using Accepted = kj::Maybe<kj::Own<kj::AsyncIoStream>>;
  return receiver_.accept()
      .then([](kj::Own<kj::AsyncIoStream> connection) -> Accepted { return kj::mv(connection); })
      .catch_([this](kj::Exception&& exception) -> Accepted {
        if (!is_retryable(exception)) {
          kj::throwFatalException(kj::mv(exception));
        }
        ++acceptErrors_;
        KJ_LOG(WARNING, "accept failed, retrying", exception.getDescription(), acceptErrors_);
        return kj::none;
      });
}

kj::Promise<void> ConnectionAcceptor::serve(kj::Own<kj::AsyncIoStream> connection,
                                            ConnectionLimiter::Slot slot) {
  auto guarded = kj::heap<VersionGuardStream>(kj::mv(connection), listener_);
  return server_.listenHttp(kj::mv(guarded)).attach(kj::mv(slot));
}

} // namespace rio::http
