#include "middleware/status_override_middleware.h"

#include <kj/async-io.h>
#include <kj/debug.h>

namespace rio::devserver {

// ============================================================================
// StatusOverrideRule
// ============================================================================

StatusOverrideRule::StatusOverrideRule(Config&& config) : enabled_(config.enabled) {
  if (config.methods.size() == 0) {
    allMethods_ = true;
  }
  for (const auto& name : config.methods) {
    if (name == "*"_kj) {
      allMethods_ = true;
      continue;
    }
    auto parsed = kj::tryParseHttpMethod(name);
    KJ_IF_SOME(method, parsed) {
      methods_.add(method);
    }
    else {
      KJ_FAIL_REQUIRE("unknown HTTP method in override list", name);
    }
  }
}

bool StatusOverrideRule::covers(kj::HttpMethod method) const {
  if (!enabled_ || method == kj::HttpMethod::GET || method == kj::HttpMethod::HEAD) {
    return false;
  }
  if (allMethods_) {
    return true;
  }
  for (auto m : methods_) {
    if (m == method) {
      return true;
    }
  }
  return false;
}

// ============================================================================
// StatusOverrideMiddleware
// ============================================================================

/**
 * Response wrapper that drops a status the rule overrides and forwards
 * everything else.
 */
class StatusOverrideMiddleware::CaptureResponse final : public kj::HttpService::Response {
public:
  CaptureResponse(kj::HttpService::Response& inner, const StatusOverrideRule& rule,
                  kj::HttpMethod method)
      : inner_(inner), rule_(rule), method_(method) {}

  kj::Own<kj::AsyncOutputStream> send(kj::uint statusCode, kj::StringPtr statusText,
                                      const kj::HttpHeaders& headers,
                                      kj::Maybe<uint64_t> expectedBodySize) override {
    if (rule_.applies(method_, statusCode)) {
      intercepted_ = true;
      return kj::heap<kj::NullStream>();
    }
    return inner_.send(statusCode, statusText, headers, expectedBodySize);
  }

  kj::Own<kj::WebSocket> acceptWebSocket(const kj::HttpHeaders& headers) override {
    return inner_.acceptWebSocket(headers);
  }

  bool intercepted() const {
    return intercepted_;
  }

private:
  kj::HttpService::Response& inner_;
  const StatusOverrideRule& rule_;
  kj::HttpMethod method_;
  bool intercepted_ = false;
};

StatusOverrideMiddleware::StatusOverrideMiddleware(const StatusOverrideRule& rule) : rule_(rule) {}

StatusOverrideMiddleware::~StatusOverrideMiddleware() noexcept = default;

kj::Promise<void> StatusOverrideMiddleware::process(RequestContext& ctx, Next& next) {
  if (!rule_.covers(ctx.method)) {
    co_await next(ctx);
    co_return;
  }

  CaptureResponse capture(ctx.response, rule_, ctx.method);
  auto captured = ctx.rebind(ctx.method, capture);
  co_await next(captured);

  if (!capture.intercepted()) {
    co_return;
  }

  ++overridden_;
  KJ_LOG(INFO, "status overridden, serving GET result", ctx.method, ctx.path);

  auto asGet = ctx.rebind(kj::HttpMethod::GET, ctx.response);
  co_await next(asGet);
}

} // namespace rio::devserver
