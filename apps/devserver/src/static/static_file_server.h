#pragma once

#include "request_context.h"

#include <cstdint>
#include <kj/async.h>
#include <kj/compat/http.h>
#include <kj/filesystem.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>
#include <rio/http/content_encoding.h>

namespace rio::devserver {

/**
 * Static file server over a read-only document root.
 *
 * Request handling:
 * - Query removed, path percent-decoded; ".." segments and NUL bytes -> 403
 * - Empty path, trailing slash or directory -> first existing index file
 * - Nothing found -> 404, whatever the method
 * - Found, method other than GET/HEAD -> 405 with Allow: GET, HEAD
 * - GET/HEAD -> 200 with Content-Type (charset on text types),
 *   Last-Modified, Server and, when negotiated, gzip Content-Encoding
 *
 * The document root is opened once in the constructor and never written.
 */
class StaticFileServer {
public:
  struct Config {
    kj::String documentRoot;              // directory to serve
    kj::Vector<kj::String> indexFiles;    // fallback order; empty means index.html, index.htm
    kj::String charset = kj::str("UTF-8"); // appended to text content types
    uint64_t maxFileSize = 64 * 1024 * 1024;
    kj::String serverName = kj::str("rio-devserver");
  };

  /**
   * A file loaded for a response.
   */
  struct FileInfo {
    kj::Array<kj::byte> content;
    kj::String contentType;
    kj::String lastModified;
  };

  /**
   * @param config Server configuration
   * @param compressor Shared response compressor (must outlive this server)
   * @throws kj::Exception if the document root does not exist
   */
  StaticFileServer(Config config, const http::ResponseCompressor& compressor);

  /**
   * Answer one request. Every outcome, error statuses included, is sent
   * through ctx.response; the promise only rejects if writing fails.
   */
  kj::Promise<void> serve_file(RequestContext& ctx);

  /**
   * Map a decoded, traversal-checked URL path to a file under the root.
   *
   * @param path Decoded path (leading slashes allowed)
   * @return Path relative to the root of the file to serve, or none
   */
  kj::Maybe<kj::Path> resolve(kj::StringPtr path) const;

  /**
   * Content-Type for a file name, with charset for text types.
   */
  kj::String detect_content_type(kj::StringPtr name) const;

  /**
   * False if the decoded path contains a ".." segment or a NUL byte.
   */
  static bool is_safe_path(kj::StringPtr path);

  /**
   * Format a timestamp as an HTTP date (RFC 7231 IMF-fixdate).
   */
  static kj::String format_http_time(kj::Date date);

  kj::StringPtr document_root() const {
    return config_.documentRoot;
  }
  kj::ArrayPtr<const kj::String> index_files() const {
    return config_.indexFiles;
  }

private:
  Config config_;
  const http::ResponseCompressor& compressor_;
  kj::Own<kj::Filesystem> fs_;
  kj::Own<const kj::ReadableDirectory> rootDir_;

  kj::Maybe<kj::Path> find_index(kj::PathPtr dir) const;
  kj::Maybe<kj::FsNode::Type> node_type(kj::PathPtr path) const;
  FileInfo read_file(kj::PathPtr path) const;

  kj::Promise<void> send_file_response(RequestContext& ctx, FileInfo info);
  kj::Promise<void> send_error(RequestContext& ctx, kj::uint status, kj::StringPtr statusText);
};

} // namespace rio::devserver
