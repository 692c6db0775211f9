#pragma once

#include "rio/http/version_guard.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <kj/async-io.h>
#include <kj/async.h>
#include <kj/compat/http.h>
#include <kj/memory.h>
#include <kj/time.h>

namespace rio::http {

/**
 * Fixed budget of concurrent connection slots.
 *
 * acquire() resolves immediately while slots remain; otherwise the caller
 * waits in FIFO order. A released slot is handed directly to the oldest
 * waiter, already wrapped in a Slot, so the active count never exceeds the
 * budget and a waiter dropped after the hand-off still gives the slot back.
 *
 * Single-threaded: all calls must come from the owning event loop.
 */
class ConnectionLimiter {
public:
  /**
   * RAII ownership of one slot. Destroying (or moving from and then
   * destroying) the Slot returns it to the limiter.
   */
  class Slot {
  public:
    Slot() = default;
    explicit Slot(ConnectionLimiter& limiter) : limiter_(&limiter) {}
    ~Slot() noexcept(false);

    Slot(Slot&& other) noexcept : limiter_(other.limiter_) {
      other.limiter_ = nullptr;
    }
    Slot& operator=(Slot&& other) noexcept(false);

    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;

    bool held() const {
      return limiter_ != nullptr;
    }

  private:
    ConnectionLimiter* limiter_ = nullptr;
  };

  explicit ConnectionLimiter(size_t maxConnections);
  ~ConnectionLimiter() noexcept(false);

  KJ_DISALLOW_COPY_AND_MOVE(ConnectionLimiter);

  /**
   * @brief Wait for a free slot.
   */
  kj::Promise<Slot> acquire();

  size_t capacity() const {
    return capacity_;
  }
  size_t active() const {
    return active_;
  }
  size_t waiting() const;

private:
  size_t capacity_;
  size_t active_ = 0;
  std::deque<kj::Own<kj::PromiseFulfiller<Slot>>> waiters_;

  void release();
};

/**
 * Accept loop bounded by a ConnectionLimiter.
 *
 * A slot is taken before accept() is called, so once the budget is spent the
 * listening socket is left alone and new clients queue in the kernel backlog.
 * Every accepted connection is wrapped in a VersionGuardStream and handed to
 * the HTTP server; its slot is released when the server finishes with it.
 *
 * Resource exhaustion on accept (EMFILE, ENFILE, ENOBUFS surface as
 * OVERLOADED) and connections aborted before accept (DISCONNECTED) are
 * logged and retried after ACCEPT_RETRY_DELAY. Any other failure ends run().
 */
class ConnectionAcceptor {
public:
  static constexpr kj::Duration ACCEPT_RETRY_DELAY = 100 * kj::MILLISECONDS;

  /**
   * @param listener Notified of request lines the version guard rejects
   */
  ConnectionAcceptor(kj::ConnectionReceiver& receiver, kj::Timer& timer, kj::HttpServer& server,
                     ConnectionLimiter& limiter,
                     kj::Maybe<RejectionListener&> listener = kj::none);

  KJ_DISALLOW_COPY_AND_MOVE(ConnectionAcceptor);

  /**
   * @brief Accept connections until the returned promise is cancelled or the
   * listener fails.
   */
  kj::Promise<void> run();

  /**
   * @brief Connections accepted since construction.
   */
  uint64_t accepted() const {
    return accepted_;
  }

  /**
   * @brief Failed accepts that were retried.
   */
  uint64_t accept_errors() const {
    return acceptErrors_;
  }

  static bool is_retryable(const kj::Exception& exception);

private:
  class TaskErrorHandler final : public kj::TaskSet::ErrorHandler {
  public:
    void taskFailed(kj::Exception&& exception) override;
  };

  kj::ConnectionReceiver& receiver_;
  kj::Timer& timer_;
  kj::HttpServer& server_;
  ConnectionLimiter& limiter_;
  kj::Maybe<RejectionListener&> listener_;
  uint64_t accepted_ = 0;
  uint64_t acceptErrors_ = 0;
  TaskErrorHandler taskErrorHandler_;
  kj::TaskSet tasks_;

  kj::Promise<kj::Maybe<kj::Own<kj::AsyncIoStream>>> try_accept();
  kj::Promise<void> serve(kj::Own<kj::AsyncIoStream> connection, ConnectionLimiter::Slot slot);
};

} // namespace rio::http
