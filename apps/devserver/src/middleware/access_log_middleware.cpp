#include "middleware/access_log_middleware.h"

#include <cstdio>
#include <ctime>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/io.h>
#include <kj/vector.h>
#include <unistd.h>

namespace rio::devserver {

namespace {

/**
 * Output stream that counts the body bytes passing through it.
 */
class CountingStream final : public kj::AsyncOutputStream {
public:
  CountingStream(kj::Own<kj::AsyncOutputStream> inner, uint64_t& counter)
      : inner_(kj::mv(inner)), counter_(counter) {}

  kj::Promise<void> write(kj::ArrayPtr<const kj::byte> buffer) override {
    counter_ += buffer.size();
    return inner_->write(buffer);
  }

  kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const kj::byte>> pieces) override {
    for (auto& piece : pieces) {
      counter_ += piece.size();
    }
    return inner_->write(pieces);
  }

  kj::Promise<void> whenWriteDisconnected() override {
    return inner_->whenWriteDisconnected();
  }

private:
  kj::Own<kj::AsyncOutputStream> inner_;
  uint64_t& counter_;
};

kj::StringPtr or_dash(kj::Maybe<kj::StringPtr> value) {
  KJ_IF_SOME(v, value) {
    if (v.size() > 0) {
      return v;
    }
  }
  return "-"_kj;
}

} // namespace

// ============================================================================
// RecordingResponse
// ============================================================================

kj::Own<kj::AsyncOutputStream>
AccessLogMiddleware::RecordingResponse::send(kj::uint statusCode, kj::StringPtr statusText,
                                             const kj::HttpHeaders& headers,
                                             kj::Maybe<uint64_t> expectedBodySize) {
  status_ = statusCode;
  auto stream = inner_.send(statusCode, statusText, headers, expectedBodySize);
  return kj::heap<CountingStream>(kj::mv(stream), bytes_);
}

kj::Own<kj::WebSocket>
AccessLogMiddleware::RecordingResponse::acceptWebSocket(const kj::HttpHeaders& headers) {
  status_ = 101;
  return inner_.acceptWebSocket(headers);
}

// ============================================================================
// AccessLogMiddleware
// ============================================================================

AccessLogMiddleware::AccessLogMiddleware(Sink sink, const kj::Clock& clock)
    : sink_(kj::mv(sink)), clock_(clock) {}

AccessLogMiddleware::~AccessLogMiddleware() noexcept = default;

kj::Promise<void> AccessLogMiddleware::process(RequestContext& ctx, Next& next) {
  auto start = clock_.now();
  auto recorder = kj::heap<RecordingResponse>(ctx.response);
  auto recorded = kj::heap<RequestContext>(ctx.rebind(ctx.method, *recorder));
  auto& recorderRef = *recorder;

  return next(*recorded)
      .then([this, &ctx, &recorderRef, start]() {
        // A handler that returns without responding leaves KJ to send 500
        write_entry(ctx, start, recorderRef.status().orDefault(500), recorderRef.bytes());
      })
      .catch_([this, &ctx, &recorderRef, start](kj::Exception&& e) -> kj::Promise<void> {
        write_entry(ctx, start, recorderRef.status().orDefault(500), recorderRef.bytes());
        return kj::mv(e);
      })
      .attach(kj::mv(recorded), kj::mv(recorder));
}

void AccessLogMiddleware::log_unserved(kj::StringPtr clientAddress, kj::StringPtr requestLine,
                                       kj::uint status, uint64_t bytes) {
  write_line(clientAddress, clock_.now(), escape_field(requestLine), status, bytes, "-"_kj,
             "-"_kj);
}

void AccessLogMiddleware::write_entry(const RequestContext& ctx, kj::Date start, kj::uint status,
                                      uint64_t bytes) {
  auto referer = escape_field(or_dash(ctx.getHeader("Referer"_kj)));
  auto userAgent = escape_field(or_dash(ctx.getHeader("User-Agent"_kj)));
  auto requestLine = kj::str(ctx.method, " ", escape_field(ctx.url), " HTTP/1.1");
  write_line(ctx.clientAddress, start, requestLine, status, bytes, referer, userAgent);
}

void AccessLogMiddleware::write_line(kj::StringPtr clientAddress, kj::Date time,
                                     kj::StringPtr requestLine, kj::uint status, uint64_t bytes,
                                     kj::StringPtr referer, kj::StringPtr userAgent) {
  auto line = kj::str(clientAddress.size() > 0 ? clientAddress : "-"_kj, " - - [",
                      format_log_time(time), "] \"", requestLine, "\" ", status, " ", bytes,
                      " \"", referer, "\" \"", userAgent, "\"");
  sink_(line);
  ++lines_;
}

AccessLogMiddleware::Sink AccessLogMiddleware::stdout_sink() {
  return [](kj::StringPtr line) {
    kj::FdOutputStream out(STDOUT_FILENO);
    out.write(kj::str(line, "\n").asBytes());
  };
}

kj::String AccessLogMiddleware::format_log_time(kj::Date date) {
  static const char* const months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

  auto seconds = static_cast<time_t>((date - kj::UNIX_EPOCH) / kj::SECONDS);
  std::tm tm_val{};
  gmtime_r(&seconds, &tm_val);

  char buffer[64];
  snprintf(buffer, sizeof(buffer), "%02d/%s/%04d:%02d:%02d:%02d +0000", tm_val.tm_mday,
           months[tm_val.tm_mon], tm_val.tm_year + 1900, tm_val.tm_hour, tm_val.tm_min,
           tm_val.tm_sec);
  return kj::str(buffer);
}

kj::String AccessLogMiddleware::escape_field(kj::StringPtr value) {
  static const char HEX[] = "0123456789ABCDEF";
  kj::Vector<char> out(value.size() + 1);
  for (char c : value) {
    auto b = static_cast<unsigned char>(c);
    if (c == '"' || c == '\\' || b < 0x20 || b == 0x7f) {
      out.add('\\');
      out.add('x');
      out.add(HEX[b >> 4]);
      out.add(HEX[b & 0x0f]);
    } else {
      out.add(c);
    }
  }
  return kj::heapString(out.begin(), out.size());
}

kj::String AccessLogMiddleware::request_line_of(kj::ArrayPtr<const char> raw) {
  size_t end = 0;
  while (end < raw.size() && raw[end] != '\r' && raw[end] != '\n') {
    ++end;
  }
  auto line = kj::heapString(raw.begin(), end);
  for (char& c : line) {
    if (c == '\0') {
      c = ' ';
    }
  }
  return line;
}

} // namespace rio::devserver
