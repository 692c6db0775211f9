#include "kj/test.h"
#include "rio/http/version_guard.h"

#include <kj/async-io.h>
#include <kj/async.h>
#include <kj/string.h>
#include <kj/vector.h>

using namespace rio::http;

namespace {

kj::String pull_all(RequestFramer& framer) {
  auto out = kj::heapArray<kj::byte>(framer.available());
  size_t n = framer.pull(out);
  return kj::heapString(reinterpret_cast<const char*>(out.begin()), n);
}

void push(RequestFramer& framer, kj::StringPtr text) {
  framer.push(text.asBytes());
}

kj::uint rejection_status(const RequestFramer& framer) {
  KJ_IF_SOME(rejection, framer.rejection()) {
    return rejection.status;
  }
  return 0;
}

// ============================================================================
// Request line classification
// ============================================================================

KJ_TEST("check_request_line: HTTP/1.0 and HTTP/1.1 pass") {
  KJ_EXPECT(RequestFramer::check_request_line("GET / HTTP/1.1"_kj) == kj::none);
  KJ_EXPECT(RequestFramer::check_request_line("POST /form HTTP/1.0"_kj) == kj::none);
  KJ_EXPECT(RequestFramer::check_request_line("GET  /a   HTTP/1.1"_kj) == kj::none);
}

KJ_TEST("check_request_line: other well-formed versions give 505") {
  for (auto line : {"GET / HTTP/2.0"_kj, "GET / HTTP/0.9"_kj, "GET / HTTP/3.0"_kj}) {
    KJ_IF_SOME(rejection, RequestFramer::check_request_line(line)) {
      KJ_EXPECT(rejection.status == 505, line);
      KJ_EXPECT(rejection.statusText == "HTTP Version Not Supported"_kj);
    }
    else {
      KJ_FAIL_EXPECT("expected rejection", line);
    }
  }
}

KJ_TEST("check_request_line: malformed or missing version gives 400") {
  for (auto line : {"GET /"_kj, "GET / HTTP/2"_kj, "GET / FOO/1.1"_kj, "GET / HTTP/1.1 extra"_kj,
                    "GET / http/1.1"_kj, "GET / HTTP/a.b"_kj}) {
    KJ_IF_SOME(rejection, RequestFramer::check_request_line(line)) {
      KJ_EXPECT(rejection.status == 400, line);
    }
    else {
      KJ_FAIL_EXPECT("expected rejection", line);
    }
  }
}

// ============================================================================
// RequestFramer
// ============================================================================

KJ_TEST("RequestFramer: valid request is released unchanged") {
  RequestFramer framer;
  auto request = "GET /index.html HTTP/1.1\r\nHost: localhost\r\n\r\n"_kj;
  push(framer, request);

  KJ_EXPECT(framer.rejection() == kj::none);
  KJ_EXPECT(pull_all(framer) == request);
  KJ_EXPECT(framer.available() == 0);
}

KJ_TEST("RequestFramer: partial request line is held back") {
  RequestFramer framer;
  push(framer, "GET / HT"_kj);
  KJ_EXPECT(framer.available() == 0);

  push(framer, "TP/1.1\r\n"_kj);
  KJ_EXPECT(pull_all(framer) == "GET / HTTP/1.1\r\n"_kj);
}

KJ_TEST("RequestFramer: unsupported version is never released") {
  RequestFramer framer;
  push(framer, "GET / HTTP/2.0\r\nHost: localhost\r\n\r\n"_kj);

  KJ_EXPECT(rejection_status(framer) == 505);
  KJ_EXPECT(framer.rejected_line() == "GET / HTTP/2.0"_kj);
  KJ_EXPECT(framer.available() == 0);

  // Later input is dropped
  push(framer, "GET / HTTP/1.1\r\n\r\n"_kj);
  KJ_EXPECT(framer.available() == 0);
}

KJ_TEST("RequestFramer: pipelined request after a valid one is checked") {
  RequestFramer framer;
  auto first = "GET /a HTTP/1.1\r\nHost: x\r\n\r\n"_kj;
  push(framer, kj::str(first, "GET /b HTTP/2.0\r\n\r\n"));

  KJ_EXPECT(rejection_status(framer) == 505);
  KJ_EXPECT(pull_all(framer) == first);
}

KJ_TEST("RequestFramer: Content-Length body is not parsed as a request line") {
  RequestFramer framer;
  auto request = "POST / HTTP/1.1\r\nContent-Length: 16\r\n\r\nGET x HTTP/9.9\r\n"_kj;
  push(framer, request);

  KJ_EXPECT(framer.rejection() == kj::none);
  KJ_EXPECT(pull_all(framer) == request);
}

KJ_TEST("RequestFramer: chunked body is skipped, next request checked") {
  RequestFramer framer;
  auto first = "POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
               "5;ext=1\r\nhello\r\n0\r\nTrailer: x\r\n\r\n"_kj;
  push(framer, kj::str(first, "GET / HTTP/3.0\r\n\r\n"));

  KJ_EXPECT(rejection_status(framer) == 505);
  KJ_EXPECT(pull_all(framer) == first);
}

KJ_TEST("RequestFramer: body split across pushes") {
  RequestFramer framer;
  push(framer, "POST / HTTP/1.1\r\ncontent-length: 10\r\n\r\n01234"_kj);
  push(framer, "56789GET / HTTP/1.0\r\n"_kj);

  KJ_EXPECT(framer.rejection() == kj::none);
  KJ_EXPECT(pull_all(framer) ==
            "POST / HTTP/1.1\r\ncontent-length: 10\r\n\r\n0123456789GET / HTTP/1.0\r\n"_kj);
}

KJ_TEST("RequestFramer: unframeable input switches to passthrough") {
  {
    RequestFramer framer;
    push(framer, "POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\nGET / HTTP/2.0\r\n"_kj);
    KJ_EXPECT(framer.passthrough());
    KJ_EXPECT(framer.rejection() == kj::none);
  }
  {
    RequestFramer framer;
    push(framer, "GET /ws HTTP/1.1\r\nUpgrade: websocket\r\n\r\nbinary"_kj);
    KJ_EXPECT(framer.passthrough());
    KJ_EXPECT(pull_all(framer) == "GET /ws HTTP/1.1\r\nUpgrade: websocket\r\n\r\nbinary"_kj);
  }
}

KJ_TEST("RequestFramer: finish releases an incomplete line") {
  RequestFramer framer;
  push(framer, "GET / HTTP/1.1"_kj);
  KJ_EXPECT(framer.available() == 0);

  framer.finish();
  KJ_EXPECT(pull_all(framer) == "GET / HTTP/1.1"_kj);
}

// ============================================================================
// VersionGuardStream
// ============================================================================

KJ_TEST("VersionGuardStream: forwards a valid request") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  auto pipe = kj::newTwoWayPipe();
  auto client = kj::mv(pipe.ends[1]);
  VersionGuardStream guard(kj::mv(pipe.ends[0]));

  // Pipe writes complete only once the other end has read them
  auto request = "GET / HTTP/1.1\r\nHost: localhost\r\n\r\n"_kj;
  auto writePromise = client->write(request.asBytes()).then([&]() { client->shutdownWrite(); });

  auto received = guard.readAllText().wait(waitScope);
  writePromise.wait(waitScope);
  KJ_EXPECT(received == request);
}

KJ_TEST("VersionGuardStream: answers HTTP/2.0 with 505 and reports EOF") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  auto pipe = kj::newTwoWayPipe();
  auto client = kj::mv(pipe.ends[1]);
  VersionGuardStream guard(kj::mv(pipe.ends[0]));

  auto writePromise = client->write("GET / HTTP/2.0\r\nHost: localhost\r\n\r\n"_kj.asBytes());
  auto responsePromise = client->readAllText();

  kj::byte buffer[256];
  size_t n = guard.tryRead(buffer, 1, sizeof(buffer)).wait(waitScope);
  KJ_EXPECT(n == 0);

  writePromise.wait(waitScope);
  auto response = responsePromise.wait(waitScope);
  KJ_EXPECT(response.startsWith("HTTP/1.1 505 HTTP Version Not Supported\r\n"_kj), response);
  KJ_EXPECT(response.endsWith("\r\n\r\nHTTP Version Not Supported"_kj), response);
}

class RecordingListener final : public RejectionListener {
public:
  void request_rejected(kj::AsyncIoStream& connection, kj::StringPtr requestLine, kj::uint status,
                        uint64_t bodyBytes) override {
    (void)connection;
    lines.add(kj::str(requestLine));
    statuses.add(status);
    bytes.add(bodyBytes);
  }

  kj::Vector<kj::String> lines;
  kj::Vector<kj::uint> statuses;
  kj::Vector<uint64_t> bytes;
};

KJ_TEST("VersionGuardStream: listener hears about the rejected request line") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  RecordingListener listener;
  auto pipe = kj::newTwoWayPipe();
  auto client = kj::mv(pipe.ends[1]);
  VersionGuardStream guard(kj::mv(pipe.ends[0]), listener);

  auto request = "PUT /upload HTTP/3.0\r\nHost: localhost\r\n\r\n"_kj;
  auto writePromise = client->write(request.asBytes());
  auto responsePromise = client->readAllText();

  kj::byte buffer[256];
  KJ_EXPECT(guard.tryRead(buffer, 1, sizeof(buffer)).wait(waitScope) == 0);
  writePromise.wait(waitScope);
  responsePromise.wait(waitScope);

  KJ_ASSERT(listener.lines.size() == 1);
  KJ_EXPECT(listener.lines[0] == "PUT /upload HTTP/3.0"_kj);
  KJ_EXPECT(listener.statuses[0] == 505);
  KJ_EXPECT(listener.bytes[0] == "HTTP Version Not Supported"_kj.size());
}

KJ_TEST("VersionGuardStream: valid traffic never reaches the listener") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  RecordingListener listener;
  auto pipe = kj::newTwoWayPipe();
  auto client = kj::mv(pipe.ends[1]);
  VersionGuardStream guard(kj::mv(pipe.ends[0]), listener);

  auto request = "GET / HTTP/1.0\r\n\r\n"_kj;
  auto writePromise = client->write(request.asBytes()).then([&]() { client->shutdownWrite(); });
  KJ_EXPECT(guard.readAllText().wait(waitScope) == request);
  writePromise.wait(waitScope);
  KJ_EXPECT(listener.lines.size() == 0);
}

KJ_TEST("VersionGuardStream: rejection response format") {
  auto text = VersionGuardStream::rejection_response({400, "Bad Request"_kj});
  KJ_EXPECT(text == "HTTP/1.1 400 Bad Request\r\n"
                    "Connection: close\r\n"
                    "Content-Type: text/plain\r\n"
                    "Content-Length: 11\r\n"
                    "\r\n"
                    "Bad Request"_kj);
}

} // namespace
