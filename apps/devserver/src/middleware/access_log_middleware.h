#pragma once

#include "middleware.h"
#include "request_context.h"

#include <cstdint>
#include <kj/compat/http.h>
#include <kj/function.h>
#include <kj/string.h>
#include <kj/time.h>

namespace rio::devserver {

/**
 * Access log middleware.
 *
 * Writes one line per completed request in combined log format:
 *
 *   127.0.0.1 - - [10/Oct/2026:13:55:36 +0000] "GET /index.html HTTP/1.1" 200 15 "-" "curl/8.0"
 *
 * The status and byte count are those the client actually received, so it
 * must sit outside StatusOverrideMiddleware in the chain. A request whose
 * handler throws is logged with status 500.
 *
 * Requests answered before they reach the middleware chain (bad request
 * lines, unsupported versions) are logged through log_unserved().
 */
class AccessLogMiddleware : public Middleware {
public:
  using Sink = kj::Function<void(kj::StringPtr line)>;

  /**
   * @param sink Receives each line, without the trailing newline
   * @param clock Source of the request timestamp
   */
  explicit AccessLogMiddleware(Sink sink,
                               const kj::Clock& clock = kj::systemPreciseCalendarClock());
  ~AccessLogMiddleware() noexcept override;

  kj::Promise<void> process(RequestContext& ctx, Next& next) override;

  /**
   * Log a request the HTTP service never saw. Referer and User-Agent are
   * written as "-" and the time is now.
   *
   * @param requestLine Request line as received, logged escaped
   */
  void log_unserved(kj::StringPtr clientAddress, kj::StringPtr requestLine, kj::uint status,
                    uint64_t bytes);

  /**
   * Sink writing each line to standard output.
   */
  static Sink stdout_sink();

  /**
   * Format a timestamp as "10/Oct/2026:13:55:36 +0000".
   */
  static kj::String format_log_time(kj::Date date);

  /**
   * Escape a header value for a quoted log field. Quotes, backslashes and
   * control bytes become \xHH.
   */
  static kj::String escape_field(kj::StringPtr value);

  /**
   * First line of a raw request head, for logging. NUL bytes left by a
   * parser become spaces.
   */
  static kj::String request_line_of(kj::ArrayPtr<const char> raw);

  uint64_t lines_written() const {
    return lines_;
  }

  /**
   * Response wrapper recording the status sent and the body size.
   */
  class RecordingResponse final : public kj::HttpService::Response {
  public:
    explicit RecordingResponse(kj::HttpService::Response& inner) : inner_(inner) {}

    kj::Own<kj::AsyncOutputStream> send(kj::uint statusCode, kj::StringPtr statusText,
                                        const kj::HttpHeaders& headers,
                                        kj::Maybe<uint64_t> expectedBodySize) override;
    kj::Own<kj::WebSocket> acceptWebSocket(const kj::HttpHeaders& headers) override;

    kj::Maybe<kj::uint> status() const {
      return status_;
    }
    uint64_t bytes() const {
      return bytes_;
    }

  private:
    kj::HttpService::Response& inner_;
    kj::Maybe<kj::uint> status_;
    uint64_t bytes_ = 0;
  };

private:
  Sink sink_;
  const kj::Clock& clock_;
  uint64_t lines_ = 0;

  void write_entry(const RequestContext& ctx, kj::Date start, kj::uint status, uint64_t bytes);
  void write_line(kj::StringPtr clientAddress, kj::Date time, kj::StringPtr requestLine,
                  kj::uint status, uint64_t bytes, kj::StringPtr referer, kj::StringPtr userAgent);
};

} // namespace rio::devserver
