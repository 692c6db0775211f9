#pragma once

#include "middleware.h"
#include "middleware/access_log_middleware.h"
#include "request_context.h"
#include "static/static_file_server.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/vector.h>
#include <rio/http/version_guard.h>

namespace rio::devserver {

/**
 * @brief HTTP front of the debug static server.
 *
 * DevServer implements kj::HttpService. For each request it splits the URL
 * into path and query string, builds a RequestContext and runs it through
 * the registered middleware (first registered = outermost) down to the
 * StaticFileServer.
 *
 * kj::HttpServer takes a per-connection factory (connection_factory()) so
 * that each request carries the client address for the access log.
 */
class DevServer final : public kj::HttpService {
public:
  /**
   * @param headerTable The HTTP header table for response headers
   * @param files Terminal handler (must outlive this server)
   */
  DevServer(const kj::HttpHeaderTable& headerTable, StaticFileServer& files);

  /**
   * @brief Append a middleware; it runs inside every one added before it.
   */
  void use(kj::Own<Middleware> middleware);

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            Response& response) override;

  /**
   * @brief Handle one request on behalf of a known client.
   */
  kj::Promise<void> handle(kj::HttpMethod method, kj::StringPtr url,
                           const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                           Response& response, kj::StringPtr clientAddress);

  /**
   * @brief Factory for kj::HttpServer creating one service per connection.
   */
  kj::HttpServer::HttpServiceFactory connection_factory();

  size_t middleware_count() const {
    return middlewares_.size();
  }

  /**
   * @brief Text form of a connection's peer address, "-" if unavailable.
   */
  static kj::String peer_address(kj::AsyncIoStream& connection);

private:
  class ConnectionService;

  const kj::HttpHeaderTable& headerTable_;
  StaticFileServer& files_;
  kj::Vector<kj::Own<Middleware>> middlewares_;

  kj::Promise<void> dispatch(size_t index, RequestContext& ctx);
};

/**
 * @brief Error handler for kj::HttpServer and the version guard.
 *
 * Logs client protocol errors (malformed request line or headers, unknown
 * method) at WARNING and unhandled application errors at ERROR, then lets
 * KJ send its default 4xx/5xx response. With an access log attached, every
 * request answered here or rejected by the version guard gets an access log
 * line as well.
 */
class ProtocolErrorLogger final : public kj::HttpServerErrorHandler,
                                  public http::RejectionListener {
public:
  /**
   * @param accessLog Must outlive this handler
   */
  void set_access_log(AccessLogMiddleware& accessLog) {
    accessLog_ = accessLog;
  }

  kj::Promise<void> handleClientProtocolError(kj::HttpHeaders::ProtocolError protocolError,
                                              kj::HttpService::Response& response) override;

  kj::Promise<void> handleApplicationError(kj::Exception exception,
                                           kj::Maybe<kj::HttpService::Response&> response) override;

  void request_rejected(kj::AsyncIoStream& connection, kj::StringPtr requestLine, kj::uint status,
                        uint64_t bodyBytes) override;

  uint64_t protocol_errors() const {
    return protocolErrors_;
  }

private:
  kj::Maybe<AccessLogMiddleware&> accessLog_;
  uint64_t protocolErrors_ = 0;
};

} // namespace rio::devserver
