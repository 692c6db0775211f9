#pragma once

#include "middleware.h"
#include "request_context.h"

#include <cstdint>
#include <kj/compat/http.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace rio::devserver {

/**
 * The method-rejection override.
 *
 * A 405 produced by static serving for one of the configured methods is
 * replaced by the result of the same request issued as GET. No other status
 * is ever rewritten.
 */
class StatusOverrideRule {
public:
  static constexpr kj::uint OVERRIDDEN_STATUS = 405;

  struct Config {
    bool enabled = true;
    kj::Vector<kj::String> methods; // method names; "*" or empty for every method
  };

  /**
   * @throws kj::Exception for an unknown method name
   */
  explicit StatusOverrideRule(Config&& config);

  /**
   * Whether a 405 for this method should be overridden. Never true for GET
   * and HEAD, which static serving does not reject.
   */
  bool covers(kj::HttpMethod method) const;

  /**
   * Whether this response status for this method is overridden.
   */
  bool applies(kj::HttpMethod method, kj::uint status) const {
    return status == OVERRIDDEN_STATUS && covers(method);
  }

  bool enabled() const {
    return enabled_;
  }

private:
  bool enabled_;
  bool allMethods_ = false;
  kj::Vector<kj::HttpMethod> methods_;
};

/**
 * Middleware applying StatusOverrideRule at the response layer.
 *
 * For a covered method the downstream handler gets a response wrapper that
 * swallows a 405 (status, headers and body) instead of sending it. When that
 * happens the request is dispatched again as GET against the real response,
 * so the client receives the GET result: 200 with the file, or whatever
 * error the GET itself produced.
 */
class StatusOverrideMiddleware : public Middleware {
public:
  explicit StatusOverrideMiddleware(const StatusOverrideRule& rule);
  ~StatusOverrideMiddleware() noexcept override;

  kj::Promise<void> process(RequestContext& ctx, Next& next) override;

  /**
   * Requests whose 405 was replaced since construction.
   */
  uint64_t overridden_count() const {
    return overridden_;
  }

private:
  class CaptureResponse;

  const StatusOverrideRule& rule_;
  uint64_t overridden_ = 0;
};

} // namespace rio::devserver
