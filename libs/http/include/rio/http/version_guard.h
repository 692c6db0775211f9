#pragma once

#include <cstdint>
#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace rio::http {

/**
 * Incremental HTTP/1.x request framer.
 *
 * Tracks message boundaries on the inbound side of a connection (request
 * line, header block, Content-Length or chunked body) so that every request
 * line can be checked before the HTTP implementation sees it. Bytes belonging
 * to a request line are held back until the whole line has arrived.
 *
 * Once a request line with an unsupported protocol version is found, no byte
 * at or after it is ever released. Framing it cannot follow (bad
 * Content-Length, oversized lines, protocol upgrades) switches the framer to
 * passthrough so the HTTP layer reports the error itself.
 */
class RequestFramer {
public:
  struct Rejection {
    kj::uint status;
    kj::StringPtr statusText;
  };

  static constexpr size_t MAX_LINE_SIZE = 64 * 1024;

  /**
   * Append bytes read from the connection and advance the state machine.
   */
  void push(kj::ArrayPtr<const kj::byte> data);

  /**
   * Input reached EOF. Anything still held is released as-is.
   */
  void finish();

  /**
   * Move up to out.size() cleared bytes into out.
   *
   * @return Number of bytes copied
   */
  size_t pull(kj::ArrayPtr<kj::byte> out);

  /**
   * Bytes cleared for release and not yet pulled.
   */
  size_t available() const {
    return cleared_ - head_;
  }

  kj::Maybe<Rejection> rejection() const {
    return rejection_;
  }

  /**
   * The request line that caused the rejection, empty before one.
   */
  kj::StringPtr rejected_line() const {
    return rejectedLine_;
  }

  bool passthrough() const {
    return state_ == State::PASSTHROUGH;
  }

  /**
   * Classify a request line.
   *
   * @param line Request line without its line terminator
   * @return A rejection for a missing, malformed or unsupported version
   */
  static kj::Maybe<Rejection> check_request_line(kj::StringPtr line);

private:
  enum class State : uint8_t {
    REQUEST_LINE,
    HEADERS,
    BODY,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    TRAILERS,
    PASSTHROUGH,
    REJECTED,
  };

  State state_ = State::REQUEST_LINE;
  kj::Vector<kj::byte> buffer_;
  size_t head_ = 0;    // first byte not yet pulled
  size_t cleared_ = 0; // end of the releasable prefix
  size_t scan_ = 0;    // next byte for the state machine
  kj::Vector<char> line_;
  uint64_t remaining_ = 0;

  // Per-message header facts
  kj::Maybe<uint64_t> contentLength_;
  bool chunked_ = false;
  bool upgrade_ = false;
  bool badFraming_ = false;

  kj::Maybe<Rejection> rejection_;
  kj::String rejectedLine_;

  void advance();
  bool take_line_byte(kj::byte c);
  void on_request_line();
  void on_header_line();
  void on_headers_complete();
  void on_chunk_size_line();
  void compact();
};

/**
 * Told about every request line VersionGuardStream answers by itself, so the
 * application can account for requests its HTTP service never sees.
 */
class RejectionListener {
public:
  virtual ~RejectionListener() noexcept(false) = default;

  /**
   * @param connection The rejected client's connection
   * @param requestLine Offending request line, without its terminator
   * @param status Status sent to the client
   * @param bodyBytes Size of the response body sent
   */
  virtual void request_rejected(kj::AsyncIoStream& connection, kj::StringPtr requestLine,
                                kj::uint status, uint64_t bodyBytes) = 0;
};

/**
 * Connection wrapper that enforces HTTP/1.0 and HTTP/1.1.
 *
 * Sits between an accepted socket and kj::HttpServer. Reads are filtered
 * through a RequestFramer; when a request line names another protocol
 * version the guard writes a 505 (or 400 for a malformed version) itself,
 * then reports EOF so the server closes the connection at the message
 * boundary. Writes go straight to the wrapped stream.
 */
class VersionGuardStream final : public kj::AsyncIoStream {
public:
  explicit VersionGuardStream(kj::Own<kj::AsyncIoStream> inner,
                              kj::Maybe<RejectionListener&> listener = kj::none);

  kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override;

  kj::Promise<void> write(kj::ArrayPtr<const kj::byte> buffer) override;
  kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const kj::byte>> pieces) override;
  kj::Promise<void> whenWriteDisconnected() override;
  void shutdownWrite() override;
  void abortRead() override;

  void getsockopt(int level, int option, void* value, kj::uint* length) override;
  void setsockopt(int level, int option, const void* value, kj::uint length) override;
  void getsockname(struct sockaddr* addr, kj::uint* length) override;
  void getpeername(struct sockaddr* addr, kj::uint* length) override;

  /**
   * Serialized response sent for a rejected request line.
   */
  static kj::String rejection_response(const RequestFramer::Rejection& rejection);

private:
  kj::Own<kj::AsyncIoStream> inner_;
  kj::Maybe<RejectionListener&> listener_;
  RequestFramer framer_;
  kj::Array<kj::byte> scratch_;
  bool inputEof_ = false;
  bool rejectionSent_ = false;

  kj::Promise<void> send_rejection(RequestFramer::Rejection rejection);
};

} // namespace rio::http
