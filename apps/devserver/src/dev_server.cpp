#include "dev_server.h"

#include <arpa/inet.h>
#include <kj/debug.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace rio::devserver {

/**
 * Per-connection service: remembers the peer address and forwards every
 * request to the shared DevServer.
 */
class DevServer::ConnectionService final : public kj::HttpService {
public:
  ConnectionService(DevServer& server, kj::String clientAddress)
      : server_(server), clientAddress_(kj::mv(clientAddress)) {}

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            Response& response) override {
    return server_.handle(method, url, headers, requestBody, response, clientAddress_);
  }

private:
  DevServer& server_;
  kj::String clientAddress_;
};

DevServer::DevServer(const kj::HttpHeaderTable& headerTable, StaticFileServer& files)
    : headerTable_(headerTable), files_(files) {}

void DevServer::use(kj::Own<Middleware> middleware) {
  middlewares_.add(kj::mv(middleware));
}

kj::Promise<void> DevServer::request(kj::HttpMethod method, kj::StringPtr url,
                                     const kj::HttpHeaders& headers,
                                     kj::AsyncInputStream& requestBody, Response& response) {
  return handle(method, url, headers, requestBody, response, "-"_kj);
}

kj::Promise<void> DevServer::handle(kj::HttpMethod method, kj::StringPtr url,
                                    const kj::HttpHeaders& headers,
                                    kj::AsyncInputStream& requestBody, Response& response,
                                    kj::StringPtr clientAddress) {
  auto path = kj::heap<kj::String>(path_of(url));
  KJ_LOG(DBG, "Incoming request", "method", method, "path", *path, "client", clientAddress);

  auto ctx = kj::heap<RequestContext>(RequestContext{
      .method = method,
      .url = url,
      .path = *path,
      .clientAddress = clientAddress,
      .headers = headers,
      .response = response,
      .headerTable = headerTable_,
  });

  auto promise = dispatch(0, *ctx);
  return promise.attach(kj::mv(ctx), kj::mv(path));
}

kj::Promise<void> DevServer::dispatch(size_t index, RequestContext& ctx) {
  if (index == middlewares_.size()) {
    return files_.serve_file(ctx);
  }

  auto next = kj::heap<Middleware::Next>(
      [this, index](RequestContext& inner) { return dispatch(index + 1, inner); });
  auto promise = middlewares_[index]->process(ctx, *next);
  return promise.attach(kj::mv(next));
}

kj::HttpServer::HttpServiceFactory DevServer::connection_factory() {
  return [this](kj::AsyncIoStream& connection) -> kj::Own<kj::HttpService> {
    return kj::heap<ConnectionService>(*this, peer_address(connection));
  };
}

kj::String DevServer::peer_address(kj::AsyncIoStream& connection) {
  struct sockaddr_storage addr {};
  kj::uint length = sizeof(addr);

  KJ_IF_SOME(e, kj::runCatchingExceptions([&]() {
               connection.getpeername(reinterpret_cast<struct sockaddr*>(&addr), &length);
             })) {
    // In-memory streams have no peer
    KJ_LOG(DBG, "peer address unavailable", e.getDescription());
    return kj::str("-");
  }

  char buffer[INET6_ADDRSTRLEN] = {};
  if (addr.ss_family == AF_INET) {
    auto* in = reinterpret_cast<struct sockaddr_in*>(&addr);
    if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer)) != nullptr) {
      return kj::str(buffer);
    }
  } else if (addr.ss_family == AF_INET6) {
    auto* in6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
    if (inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer)) != nullptr) {
      return kj::str(buffer);
    }
  }
  return kj::str("-");
}

// ============================================================================
// ProtocolErrorLogger
// ============================================================================

kj::Promise<void>
ProtocolErrorLogger::handleClientProtocolError(kj::HttpHeaders::ProtocolError protocolError,
                                               kj::HttpService::Response& response) {
  ++protocolErrors_;
  KJ_LOG(WARNING, "client protocol error", protocolError.statusCode, protocolError.description);

  KJ_IF_SOME(accessLog, accessLog_) {
    auto requestLine = AccessLogMiddleware::request_line_of(protocolError.rawContent);
    auto recorder = kj::heap<AccessLogMiddleware::RecordingResponse>(response);
    auto& recorderRef = *recorder;
    auto promise =
        kj::HttpServerErrorHandler::handleClientProtocolError(kj::mv(protocolError), recorderRef);
    // The peer address is not known at this layer
    return promise
        .then([&accessLog, &recorderRef, requestLine = kj::mv(requestLine)]() {
          accessLog.log_unserved("-"_kj, requestLine, recorderRef.status().orDefault(400),
                                 recorderRef.bytes());
        })
        .attach(kj::mv(recorder));
  }
  return kj::HttpServerErrorHandler::handleClientProtocolError(kj::mv(protocolError), response);
}

void ProtocolErrorLogger::request_rejected(kj::AsyncIoStream& connection,
                                           kj::StringPtr requestLine, kj::uint status,
                                           uint64_t bodyBytes) {
  KJ_IF_SOME(accessLog, accessLog_) {
    accessLog.log_unserved(DevServer::peer_address(connection), requestLine, status, bodyBytes);
  }
}

kj::Promise<void>
ProtocolErrorLogger::handleApplicationError(kj::Exception exception,
                                            kj::Maybe<kj::HttpService::Response&> response) {
  if (exception.getType() == kj::Exception::Type::DISCONNECTED) {
    KJ_LOG(INFO, "client disconnected mid-request", exception.getDescription());
  } else {
    KJ_LOG(ERROR, "unhandled error while serving request", exception);
  }
  return kj::HttpServerErrorHandler::handleApplicationError(kj::mv(exception), response);
}

} // namespace rio::devserver
