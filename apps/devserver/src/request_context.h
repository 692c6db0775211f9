#pragma once

#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/string.h>
#include <rio/http/text_util.h>

namespace rio::devserver {

/**
 * Per-request context passed through the middleware chain to the static
 * file server.
 *
 * Holds references only; everything it points at is owned by kj::HttpServer
 * for the duration of the request. A middleware that needs to change the
 * method or the response object builds a new context from this one with
 * rebind().
 */
struct RequestContext {
  // Request data
  kj::HttpMethod method;
  kj::StringPtr url;           // request target as received
  kj::StringPtr path;          // url path without the query, still percent-encoded
  kj::StringPtr clientAddress; // peer IP, or "-" when unknown
  const kj::HttpHeaders& headers;

  // Response object (for sending responses)
  kj::HttpService::Response& response;

  // Header table reference (needed for creating response headers)
  const kj::HttpHeaderTable& headerTable;

  /**
   * Same request with a different method and/or response object.
   */
  RequestContext rebind(kj::HttpMethod newMethod, kj::HttpService::Response& newResponse) const {
    return RequestContext{
        .method = newMethod,
        .url = url,
        .path = path,
        .clientAddress = clientAddress,
        .headers = headers,
        .response = newResponse,
        .headerTable = headerTable,
    };
  }

  // Case-insensitive lookup of a request header
  kj::Maybe<kj::StringPtr> getHeader(kj::StringPtr name) const;
};

inline kj::Maybe<kj::StringPtr> RequestContext::getHeader(kj::StringPtr name) const {
  kj::Maybe<kj::StringPtr> result = kj::none;
  headers.forEach([&](kj::StringPtr headerName, kj::StringPtr headerValue) {
    if (http::equals_ignore_case(headerName, name)) {
      result = headerValue;
    }
  });
  return result;
}

/**
 * @brief Path part of a request target, query removed.
 *
 * Absolute-form targets ("http://host/a?b") lose their scheme and authority;
 * an authority without a path yields "/".
 */
inline kj::String path_of(kj::StringPtr url) {
  kj::StringPtr target = url;
  if (!url.startsWith("/"_kj)) {
    KJ_IF_SOME(schemeEnd, url.find("://"_kj)) {
      auto authority = url.slice(schemeEnd + 3);
      size_t end = 0;
      while (end < authority.size() && authority[end] != '/' && authority[end] != '?') {
        ++end;
      }
      target = authority.slice(end);
    }
  }

  size_t length = target.size();
  KJ_IF_SOME(queryStart, target.findFirst('?')) {
    length = queryStart;
  }
  if (length == 0 && target.size() != url.size()) {
    return kj::str("/");
  }
  return kj::heapString(target.begin(), length);
}

} // namespace rio::devserver
