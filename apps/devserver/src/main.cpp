/**
 * @file main.cpp
 * @brief Main entry point for the rio debug static server
 *
 * Serves a read-only document root over HTTP/1.1 the way the edge sees it
 * during local testing: index fallback, gzip, and non-GET requests to
 * static files answered with the GET result instead of 405.
 *
 * Initialization order (dependencies first):
 * 1. Response compressor
 * 2. Static file server (opens the document root)
 * 3. Middleware chain (access log, 405 override)
 * 4. HTTP service and server
 * 5. Connection limiter
 *
 * Shutdown sequence:
 * 1. Stop accepting new connections
 * 2. Drain open connections (bounded wait)
 * 3. Release components in reverse order
 *
 * Configuration via environment variables (see server_config.h):
 * - RIO_HOST (default: 0.0.0.0)
 * - RIO_PORT (default: 80)
 * - RIO_DOCUMENT_ROOT (default: /srv/www)
 * - RIO_MAX_CONNECTIONS (default: 1024)
 * - RIO_KEEPALIVE_TIMEOUT (default: 65), RIO_HEADER_TIMEOUT (default: 60)
 * - RIO_GZIP, RIO_GZIP_LEVEL, RIO_GZIP_MIN_LENGTH, RIO_GZIP_TYPES, RIO_GZIP_VARY
 * - RIO_OVERRIDE_405, RIO_OVERRIDE_METHODS
 * - RIO_ACCESS_LOG, RIO_LOG_LEVEL
 */

#include <atomic>
#include <csignal>
#include <exception>
#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/string.h>
#include <rio/http/connection_limiter.h>
#include <rio/http/content_encoding.h>

#include "dev_server.h"
#include "middleware/access_log_middleware.h"
#include "middleware/status_override_middleware.h"
#include "server_config.h"
#include "static/static_file_server.h"

namespace rio::devserver {

// ============================================================================
// Signal Handling
// ============================================================================

namespace {

constexpr auto SHUTDOWN_POLL_INTERVAL = 100 * kj::MILLISECONDS;
constexpr auto DRAIN_TIMEOUT = 5 * kj::SECONDS;

// Uses std::atomic for lock-free access from signal handler
std::atomic<bool> g_shutdown_requested{false};
std::atomic<int> g_shutdown_signal{0};

/**
 * @brief Signal handler for graceful shutdown
 *
 * Only sets atomics; everything else happens on the event loop.
 */
void signal_handler(int signal) {
  g_shutdown_signal.store(signal, std::memory_order_release);
  g_shutdown_requested.store(true, std::memory_order_release);
}

} // namespace

// ============================================================================
// Component Lifecycle Manager
// ============================================================================

/**
 * @brief Owns every server component and runs the listener.
 */
class DevServerLifecycle {
public:
  DevServerLifecycle(const ServerConfig& config, kj::AsyncIoContext& io)
      : config_(config), io_(io) {}

  ~DevServerLifecycle() noexcept(false) {
    cleanup();
  }

  KJ_DISALLOW_COPY_AND_MOVE(DevServerLifecycle);

  /**
   * @brief Build components in dependency order
   *
   * @throws kj::Exception if the document root cannot be opened or a
   * setting is rejected by a component
   */
  void initialize() {
    KJ_LOG(INFO, "[1/5] Initializing response compressor", "gzip", config_.gzip_enabled, "level",
           config_.gzip_level, "min_length", config_.gzip_min_length);
    compressor_ = kj::heap<http::ResponseCompressor>(config_.compressor_config());

    KJ_LOG(INFO, "[2/5] Opening document root", config_.document_root);
    static_file_server_ = kj::heap<StaticFileServer>(config_.static_file_config(), *compressor_);

    KJ_LOG(INFO, "[3/5] Initializing middleware chain", "access_log", config_.access_log,
           "override_405", config_.override_405);
    override_rule_ = kj::heap<StatusOverrideRule>(config_.override_config());

    header_table_ = kj::heap<kj::HttpHeaderTable>();
    dev_server_ = kj::heap<DevServer>(*header_table_, *static_file_server_);
    if (config_.access_log) {
      auto accessLog = kj::heap<AccessLogMiddleware>(AccessLogMiddleware::stdout_sink());
      error_logger_.set_access_log(*accessLog);
      dev_server_->use(kj::mv(accessLog));
    }
    dev_server_->use(kj::heap<StatusOverrideMiddleware>(*override_rule_));

    KJ_LOG(INFO, "[4/5] Initializing HTTP server", "keepalive_s",
           config_.keepalive_timeout_seconds, "header_timeout_s", config_.header_timeout_seconds);
    auto settings = config_.http_server_settings();
    settings.errorHandler = error_logger_;
    http_server_ = kj::heap<kj::HttpServer>(io_.provider->getTimer(), *header_table_,
                                            dev_server_->connection_factory(), settings);

    KJ_LOG(INFO, "[5/5] Initializing connection limiter", "max_connections",
           config_.max_connections);
    limiter_ = kj::heap<http::ConnectionLimiter>(config_.max_connections);

    KJ_LOG(INFO, "All components initialized successfully");
  }

  /**
   * @brief Listen and serve until a shutdown signal arrives
   */
  kj::Promise<void> run() {
    auto& network = io_.provider->getNetwork();
    auto addr = co_await network.parseAddress(config_.host, config_.port);
    auto listener = addr->listen();

    KJ_LOG(INFO, "HTTP server listening", "address", kj::str(config_.host, ":", config_.port),
           "document_root", config_.document_root);

    http::ConnectionAcceptor acceptor(*listener, io_.provider->getTimer(), *http_server_,
                                      *limiter_, error_logger_);

    // Either the listener fails or a signal arrives
    co_await acceptor.run().exclusiveJoin(waitForShutdown());

    KJ_LOG(INFO, "Stopped accepting new connections", "accepted", acceptor.accepted(), "active",
           limiter_->active());

    co_await http_server_->drain().exclusiveJoin(
        io_.provider->getTimer().afterDelay(DRAIN_TIMEOUT).then(
            [this]() { KJ_LOG(WARNING, "Drain timed out", "active", limiter_->active()); }));
  }

  /**
   * @brief Wait for shutdown signal
   */
  kj::Promise<void> waitForShutdown() {
    while (!g_shutdown_requested.load(std::memory_order_acquire)) {
      co_await io_.provider->getTimer().afterDelay(SHUTDOWN_POLL_INTERVAL);
    }
    KJ_LOG(INFO, "Shutdown signal received", "signal",
           g_shutdown_signal.load(std::memory_order_acquire));
  }

  /**
   * @brief Release components in reverse dependency order
   */
  void cleanup() {
    if (cleaned_up_) {
      return;
    }
    cleaned_up_ = true;

    KJ_LOG(INFO, "Starting shutdown sequence");
    limiter_ = nullptr;
    http_server_ = nullptr;
    dev_server_ = nullptr;
    override_rule_ = nullptr;
    static_file_server_ = nullptr;
    compressor_ = nullptr;
    KJ_LOG(INFO, "Shutdown complete");
  }

private:
  const ServerConfig& config_;
  kj::AsyncIoContext& io_;
  bool cleaned_up_ = false;

  ProtocolErrorLogger error_logger_;
  kj::Own<kj::HttpHeaderTable> header_table_;
  kj::Own<http::ResponseCompressor> compressor_;
  kj::Own<StaticFileServer> static_file_server_;
  kj::Own<StatusOverrideRule> override_rule_;
  kj::Own<DevServer> dev_server_;
  kj::Own<kj::HttpServer> http_server_;
  kj::Own<http::ConnectionLimiter> limiter_;
};

} // namespace rio::devserver

// ============================================================================
// Main Entry Point
// ============================================================================

/**
 * @brief Main entry point for the rio debug static server
 *
 * 1. Load and validate configuration from the environment
 * 2. Apply the log level
 * 3. Register SIGTERM/SIGINT handlers
 * 4. Create the KJ event loop and initialize components
 * 5. Serve until signalled
 *
 * @return 0 on clean shutdown, 1 on error
 */
int main(int argc, char** argv) {
  using namespace rio::devserver;
  (void)argc;
  (void)argv;

  try {
    auto config = ServerConfig::loadFromEnv();
    config.validate();
    kj::_::Debug::setLogLevel(config.log_severity());

    KJ_LOG(INFO, "========================================");
    KJ_LOG(INFO, "  rio devserver starting");
    KJ_LOG(INFO, "========================================");
    KJ_LOG(INFO, "Configuration:", "host", config.host, "port", config.port, "document_root",
           config.document_root, "max_connections", config.max_connections);

    // SIGTERM: container stop; SIGINT: Ctrl+C
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);
    KJ_LOG(INFO, "Signal handlers registered (SIGTERM, SIGINT)");

    auto io = kj::setupAsyncIo();
    auto lifecycle = kj::heap<DevServerLifecycle>(config, io);

    try {
      lifecycle->initialize();
    } catch (const kj::Exception& e) {
      KJ_LOG(ERROR, "Component initialization failed", e.getDescription());
      return 1;
    }

    try {
      lifecycle->run().wait(io.waitScope);
    } catch (const kj::Exception& e) {
      KJ_LOG(ERROR, "Server error", e.getDescription());
      return 1;
    }

    lifecycle = nullptr;
    return 0;

  } catch (const kj::Exception& e) {
    KJ_LOG(ERROR, "Fatal KJ exception", e.getDescription());
    return 1;
  } catch (const std::exception& e) {
    KJ_LOG(ERROR, "Fatal std::exception", e.what());
    return 1;
  }
}
