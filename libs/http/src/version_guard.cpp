#include "rio/http/version_guard.h"

#include "rio/http/text_util.h"

#include <cstring>
#include <kj/debug.h>

namespace rio::http {

namespace {

constexpr size_t READ_CHUNK_SIZE = 8192;
constexpr size_t COMPACT_THRESHOLD = 64 * 1024;

kj::Maybe<uint64_t> parse_decimal(kj::StringPtr text) {
  if (text.size() == 0 || text.size() > 19) {
    return kj::none;
  }
  uint64_t value = 0;
  for (char c : text) {
    if (!is_digit(c)) {
      return kj::none;
    }
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  return value;
}

kj::Maybe<uint64_t> parse_hex(kj::StringPtr text) {
  if (text.size() == 0 || text.size() > 15) {
    return kj::none;
  }
  uint64_t value = 0;
  for (char c : text) {
    uint64_t digit;
    if (is_digit(c)) {
      digit = static_cast<uint64_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint64_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint64_t>(c - 'A' + 10);
    } else {
      return kj::none;
    }
    value = value * 16 + digit;
  }
  return value;
}

} // namespace

// ============================================================================
// RequestFramer
// ============================================================================

kj::Maybe<RequestFramer::Rejection> RequestFramer::check_request_line(kj::StringPtr line) {
  kj::Vector<kj::String> words;
  size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && is_space(line[pos])) {
      ++pos;
    }
    size_t start = pos;
    while (pos < line.size() && !is_space(line[pos])) {
      ++pos;
    }
    if (pos > start) {
      words.add(kj::heapString(line.begin() + start, pos - start));
    }
  }

  if (words.size() != 3) {
    // Covers HTTP/0.9 style "GET /" lines as well
    return Rejection{400, "Bad Request"_kj};
  }

  kj::StringPtr version = words[2];
  if (version == "HTTP/1.1"_kj || version == "HTTP/1.0"_kj) {
    return kj::none;
  }
  if (version.size() == 8 && version.startsWith("HTTP/"_kj) && is_digit(version[5]) &&
      version[6] == '.' && is_digit(version[7])) {
    return Rejection{505, "HTTP Version Not Supported"_kj};
  }
  return Rejection{400, "Bad Request"_kj};
}

void RequestFramer::push(kj::ArrayPtr<const kj::byte> data) {
  if (state_ == State::REJECTED) {
    return;
  }
  buffer_.addAll(data);
  advance();
}

void RequestFramer::finish() {
  if (state_ != State::REJECTED) {
    state_ = State::PASSTHROUGH;
    cleared_ = buffer_.size();
    scan_ = buffer_.size();
  }
}

size_t RequestFramer::pull(kj::ArrayPtr<kj::byte> out) {
  size_t n = kj::min(out.size(), available());
  if (n > 0) {
    memcpy(out.begin(), buffer_.begin() + head_, n);
    head_ += n;
    compact();
  }
  return n;
}

void RequestFramer::compact() {
  if (head_ == buffer_.size()) {
    buffer_.clear();
    head_ = 0;
    cleared_ = 0;
    scan_ = 0;
    return;
  }
  if (head_ >= COMPACT_THRESHOLD) {
    kj::Vector<kj::byte> rest(buffer_.size() - head_);
    rest.addAll(buffer_.begin() + head_, buffer_.end());
    buffer_ = kj::mv(rest);
    cleared_ -= head_;
    scan_ -= head_;
    head_ = 0;
  }
}

bool RequestFramer::take_line_byte(kj::byte c) {
  if (c == '\n') {
    if (line_.size() > 0 && line_.back() == '\r') {
      line_.removeLast();
    }
    return true;
  }
  line_.add(static_cast<char>(c));
  if (line_.size() > MAX_LINE_SIZE) {
    state_ = State::PASSTHROUGH;
  }
  return false;
}

void RequestFramer::advance() {
  while (scan_ < buffer_.size()) {
    switch (state_) {
    case State::PASSTHROUGH:
      cleared_ = buffer_.size();
      scan_ = buffer_.size();
      return;

    case State::REJECTED:
      return;

    case State::REQUEST_LINE:
      // Held back: cleared_ only moves once the line is known to be valid.
      if (take_line_byte(buffer_[scan_++])) {
        on_request_line();
      }
      break;

    case State::HEADERS:
      if (take_line_byte(buffer_[scan_++])) {
        on_header_line();
      }
      cleared_ = scan_;
      break;

    case State::BODY:
    case State::CHUNK_DATA: {
      uint64_t n = kj::min(remaining_, static_cast<uint64_t>(buffer_.size() - scan_));
      scan_ += n;
      remaining_ -= n;
      cleared_ = scan_;
      if (remaining_ == 0) {
        state_ = state_ == State::BODY ? State::REQUEST_LINE : State::CHUNK_DATA_END;
      }
      break;
    }

    case State::CHUNK_SIZE:
      if (take_line_byte(buffer_[scan_++])) {
        on_chunk_size_line();
      }
      cleared_ = scan_;
      break;

    case State::CHUNK_DATA_END:
      if (take_line_byte(buffer_[scan_++])) {
        line_.clear();
        state_ = State::CHUNK_SIZE;
      }
      cleared_ = scan_;
      break;

    case State::TRAILERS:
      if (take_line_byte(buffer_[scan_++])) {
        bool empty = line_.size() == 0;
        line_.clear();
        if (empty) {
          state_ = State::REQUEST_LINE;
        }
      }
      cleared_ = scan_;
      break;
    }
  }

  if (state_ == State::PASSTHROUGH) {
    cleared_ = buffer_.size();
  }
}

void RequestFramer::on_request_line() {
  if (line_.size() == 0) {
    // Stray CRLF between messages
    cleared_ = scan_;
    return;
  }

  kj::String line = kj::heapString(line_.begin(), line_.size());
  line_.clear();

  KJ_IF_SOME(rejection, check_request_line(line)) {
    rejection_ = rejection;
    rejectedLine_ = kj::mv(line);
    state_ = State::REJECTED;
    return;
  }

  cleared_ = scan_;
  contentLength_ = kj::none;
  chunked_ = false;
  upgrade_ = false;
  badFraming_ = false;
  state_ = State::HEADERS;
}

void RequestFramer::on_header_line() {
  if (line_.size() == 0) {
    on_headers_complete();
    return;
  }

  kj::String line = kj::heapString(line_.begin(), line_.size());
  KJ_IF_SOME(colon, line.findFirst(':')) {
    kj::String name = kj::heapString(line.begin(), colon);
    auto value = trim(line.slice(colon + 1));

    if (equals_ignore_case(name, "Content-Length"_kj)) {
      KJ_IF_SOME(length, parse_decimal(value)) {
        KJ_IF_SOME(previous, contentLength_) {
          if (previous != length) {
            badFraming_ = true;
          }
        }
        contentLength_ = length;
      }
      else {
        badFraming_ = true;
      }
    } else if (equals_ignore_case(name, "Transfer-Encoding"_kj)) {
      // The final coding decides whether the body is chunked
      kj::StringPtr last = value;
      KJ_IF_SOME(comma, value.findLast(',')) {
        last = value.slice(comma + 1);
      }
      chunked_ = equals_ignore_case(trim(last), "chunked"_kj);
      if (!chunked_) {
        badFraming_ = true;
      }
    } else if (equals_ignore_case(name, "Upgrade"_kj)) {
      upgrade_ = true;
    }
  }
  line_.clear();
}

void RequestFramer::on_headers_complete() {
  if (badFraming_ || upgrade_) {
    state_ = State::PASSTHROUGH;
    return;
  }
  if (chunked_) {
    state_ = State::CHUNK_SIZE;
    return;
  }
  KJ_IF_SOME(length, contentLength_) {
    if (length > 0) {
      remaining_ = length;
      state_ = State::BODY;
      return;
    }
  }
  state_ = State::REQUEST_LINE;
}

void RequestFramer::on_chunk_size_line() {
  kj::String text = kj::heapString(line_.begin(), line_.size());
  size_t end = text.size();
  KJ_IF_SOME(semi, text.findFirst(';')) {
    // Chunk extensions are ignored
    end = semi;
  }
  auto sizeText = trim(kj::heapString(text.begin(), end));
  line_.clear();

  KJ_IF_SOME(size, parse_hex(sizeText)) {
    if (size == 0) {
      state_ = State::TRAILERS;
    } else {
      remaining_ = size;
      state_ = State::CHUNK_DATA;
    }
  }
  else {
    state_ = State::PASSTHROUGH;
  }
}

// ============================================================================
// VersionGuardStream
// ============================================================================

VersionGuardStream::VersionGuardStream(kj::Own<kj::AsyncIoStream> inner,
                                       kj::Maybe<RejectionListener&> listener)
    : inner_(kj::mv(inner)), listener_(listener),
      scratch_(kj::heapArray<kj::byte>(READ_CHUNK_SIZE)) {}

kj::Promise<size_t> VersionGuardStream::tryRead(void* buffer, size_t minBytes, size_t maxBytes) {
  auto out = static_cast<kj::byte*>(buffer);
  size_t wanted = kj::max(minBytes, static_cast<size_t>(1));
  size_t total = 0;

  for (;;) {
    total += framer_.pull(kj::arrayPtr(out + total, maxBytes - total));
    if (total >= wanted || total == maxBytes) {
      co_return total;
    }

    auto rejected = framer_.rejection();
    KJ_IF_SOME(rejection, rejected) {
      if (total == 0 && !rejectionSent_) {
        co_await send_rejection(rejection);
      }
      co_return total;
    }

    if (inputEof_) {
      co_return total;
    }

    size_t n = co_await inner_->tryRead(scratch_.begin(), 1, scratch_.size());
    if (n == 0) {
      inputEof_ = true;
      framer_.finish();
    } else {
      framer_.push(scratch_.first(n));
    }
  }
}

kj::Promise<void> VersionGuardStream::send_rejection(RequestFramer::Rejection rejection) {
  rejectionSent_ = true;
  KJ_LOG(WARNING, "rejecting request line", rejection.status, rejection.statusText);

  auto response = rejection_response(rejection);
  co_await inner_->write(response.asBytes());
  inner_->shutdownWrite();

  KJ_IF_SOME(listener, listener_) {
    listener.request_rejected(*inner_, framer_.rejected_line(), rejection.status,
                              rejection.statusText.size());
  }
}

kj::String VersionGuardStream::rejection_response(const RequestFramer::Rejection& rejection) {
  return kj::str("HTTP/1.1 ", rejection.status, " ", rejection.statusText,
                 "\r\n"
                 "Connection: close\r\n"
                 "Content-Type: text/plain\r\n"
                 "Content-Length: ",
                 rejection.statusText.size(), "\r\n\r\n", rejection.statusText);
}

kj::Promise<void> VersionGuardStream::write(kj::ArrayPtr<const kj::byte> buffer) {
  return inner_->write(buffer);
}

kj::Promise<void>
VersionGuardStream::write(kj::ArrayPtr<const kj::ArrayPtr<const kj::byte>> pieces) {
  return inner_->write(pieces);
}

kj::Promise<void> VersionGuardStream::whenWriteDisconnected() {
  return inner_->whenWriteDisconnected();
}

void VersionGuardStream::shutdownWrite() {
  if (!rejectionSent_) {
    inner_->shutdownWrite();
  }
}

void VersionGuardStream::abortRead() {
  inner_->abortRead();
}

void VersionGuardStream::getsockopt(int level, int option, void* value, kj::uint* length) {
  inner_->getsockopt(level, option, value, length);
}

void VersionGuardStream::setsockopt(int level, int option, const void* value, kj::uint length) {
  inner_->setsockopt(level, option, value, length);
}

void VersionGuardStream::getsockname(struct sockaddr* addr, kj::uint* length) {
  inner_->getsockname(addr, length);
}

void VersionGuardStream::getpeername(struct sockaddr* addr, kj::uint* length) {
  inner_->getpeername(addr, length);
}

} // namespace rio::http
