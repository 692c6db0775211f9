#pragma once

#include "request_context.h"

#include <kj/async.h>
#include <kj/function.h>

namespace rio::devserver {

/**
 * Base interface for middleware components.
 *
 * A middleware receives the request context and a callable that runs the
 * rest of the chain. It may call next() zero, one or several times, and may
 * pass it a different context (for example one whose response object is
 * wrapped) as long as that context outlives the returned promise.
 */
class Middleware {
public:
  using Next = kj::Function<kj::Promise<void>(RequestContext& ctx)>;

  virtual ~Middleware() noexcept = default;

  /**
   * Process the request through this middleware.
   *
   * @param ctx The request context
   * @param next Runs the next middleware, or the terminal handler
   * @return Promise that completes when the response has been sent
   */
  virtual kj::Promise<void> process(RequestContext& ctx, Next& next) = 0;
};

} // namespace rio::devserver
