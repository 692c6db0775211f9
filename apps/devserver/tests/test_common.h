#pragma once

#include "request_context.h"

#include <kj/async-io.h>
#include <kj/async.h>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <unistd.h>

namespace rio::devserver::test {

/**
 * @brief Test context with async I/O setup
 */
class TestContext {
public:
  TestContext()
      : io_(kj::setupAsyncIo()), headerTableOwn_(kj::heap<kj::HttpHeaderTable>()),
        headerTable_(*headerTableOwn_), waitScope_(io_.waitScope) {}

  kj::AsyncIoContext& io() {
    return io_;
  }
  kj::HttpHeaderTable& headerTable() {
    return headerTable_;
  }
  kj::WaitScope& waitScope() {
    return waitScope_;
  }

private:
  kj::AsyncIoContext io_;
  kj::Own<kj::HttpHeaderTable> headerTableOwn_;
  kj::HttpHeaderTable& headerTable_;
  kj::WaitScope& waitScope_;
};

/**
 * @brief Mock output stream appending every write to a shared buffer
 */
class MockAsyncOutputStream final : public kj::AsyncOutputStream {
public:
  explicit MockAsyncOutputStream(kj::Vector<kj::byte>& sink) : sink_(sink) {}

  kj::Promise<void> write(kj::ArrayPtr<const kj::byte> buffer) override {
    sink_.addAll(buffer);
    return kj::READY_NOW;
  }

  kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const kj::byte>> pieces) override {
    for (auto& piece : pieces) {
      sink_.addAll(piece);
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> whenWriteDisconnected() override {
    return kj::NEVER_DONE;
  }

private:
  kj::Vector<kj::byte>& sink_;
};

/**
 * @brief Case-insensitive header lookup
 */
inline kj::Maybe<kj::StringPtr> find_header(const kj::HttpHeaders& headers, kj::StringPtr name) {
  kj::Maybe<kj::StringPtr> result = kj::none;
  headers.forEach([&](kj::StringPtr headerName, kj::StringPtr headerValue) {
    if (http::equals_ignore_case(headerName, name)) {
      result = headerValue;
    }
  });
  return result;
}

/**
 * @brief Mock HTTP response for testing
 *
 * Records status, headers and expected body size of the last send(), and
 * accumulates the body bytes written through the returned stream.
 */
class MockHttpResponse : public kj::HttpService::Response {
public:
  kj::uint statusCode = 0;
  kj::String statusText;
  kj::HttpHeaders responseHeaders;
  kj::Maybe<uint64_t> expectedBodySize;
  kj::Vector<kj::byte> body;
  int sendCount = 0;

  explicit MockHttpResponse(const kj::HttpHeaderTable& headerTable)
      : responseHeaders(headerTable) {}

  kj::Own<kj::AsyncOutputStream> send(kj::uint status, kj::StringPtr text,
                                      const kj::HttpHeaders& headers,
                                      kj::Maybe<uint64_t> bodySize) override {
    ++sendCount;
    statusCode = status;
    statusText = kj::str(text);
    responseHeaders = headers.clone();
    expectedBodySize = bodySize;
    return kj::heap<MockAsyncOutputStream>(body);
  }

  kj::Own<kj::WebSocket> acceptWebSocket(const kj::HttpHeaders&) override {
    KJ_FAIL_REQUIRE("WebSocket not expected in tests");
  }

  kj::String body_text() const {
    return kj::heapString(reinterpret_cast<const char*>(body.begin()), body.size());
  }

  kj::Maybe<kj::StringPtr> header(kj::StringPtr name) const {
    return find_header(responseHeaders, name);
  }
};

/**
 * @brief One request plus everything its RequestContext points at
 */
struct MockRequest {
  kj::HttpMethod method;
  kj::String url;
  kj::String path;
  kj::String clientAddress = kj::str("127.0.0.1");
  kj::HttpHeaders headers;
  MockHttpResponse response;
  const kj::HttpHeaderTable& headerTable;

  MockRequest(const kj::HttpHeaderTable& table, kj::HttpMethod method, kj::StringPtr url)
      : method(method), url(kj::str(url)), path(path_of(url)), headers(table), response(table),
        headerTable(table) {}

  RequestContext context() {
    return RequestContext{
        .method = method,
        .url = url,
        .path = path,
        .clientAddress = clientAddress,
        .headers = headers,
        .response = response,
        .headerTable = headerTable,
    };
  }
};

/**
 * @brief Temporary directory under /tmp, removed on destruction
 */
class TempDir {
public:
  TempDir() : fs_(kj::newDiskFilesystem()), tempPath_(nullptr) {
    static int counter = 0;
    auto basePath = fs_->getCurrentPath().evalNative("/tmp");
    auto uniqueName = kj::str("rio_devserver_test_", getpid(), "_", counter++);
    tempPath_ = basePath.append(uniqueName);

    (void)fs_->getRoot().tryRemove(tempPath_);
    dir_ = fs_->getRoot().openSubdir(tempPath_,
                                     kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT);
  }

  ~TempDir() noexcept(false) {
    KJ_IF_SOME(e, kj::runCatchingExceptions(
                      [&]() { (void)fs_->getRoot().tryRemove(tempPath_); })) {
      KJ_LOG(WARNING, "failed to remove temp dir", tempPath_.toString(), e.getDescription());
    }
  }

  KJ_DISALLOW_COPY_AND_MOVE(TempDir);

  kj::String nativePath() const {
    return tempPath_.toNativeString(true);
  }

  void writeFile(kj::StringPtr name, kj::StringPtr content) {
    auto path = kj::Path::parse(name);
    auto file = dir_->openFile(path, kj::WriteMode::CREATE | kj::WriteMode::MODIFY |
                                         kj::WriteMode::CREATE_PARENT);
    file->writeAll(content);
  }

  void makeDir(kj::StringPtr name) {
    dir_->openSubdir(kj::Path::parse(name),
                     kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT);
  }

private:
  kj::Own<kj::Filesystem> fs_;
  kj::Path tempPath_;
  kj::Own<const kj::Directory> dir_;
};

/**
 * @brief Helper to check if a string contains a substring
 */
inline bool responseContains(kj::StringPtr response, kj::StringPtr substr) {
  return response.find(substr) != kj::none;
}

} // namespace rio::devserver::test
