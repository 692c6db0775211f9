#include "static/static_file_server.h"

#include <cstdio>
#include <ctime>
#include <kj/debug.h>
#include <kj/encoding.h>
#include <kj/map.h>
#include <rio/http/text_util.h>

namespace rio::devserver {

// ============================================================================
// MIME Type Registry
// ============================================================================

namespace {

struct MimeType {
  kj::StringPtr type;
  bool text; // in nginx's default charset_types, gets "; charset=..."
};

const kj::HashMap<kj::StringPtr, MimeType>& get_mime_type_map() {
  static const kj::HashMap<kj::StringPtr, MimeType> mime_types = [] {
    kj::HashMap<kj::StringPtr, MimeType> map;
    map.insert(".html", {"text/html"_kj, true});
    map.insert(".htm", {"text/html"_kj, true});
    map.insert(".shtml", {"text/html"_kj, true});
    map.insert(".css", {"text/css"_kj, false});
    map.insert(".xml", {"text/xml"_kj, true});
    map.insert(".txt", {"text/plain"_kj, true});
    map.insert(".md", {"text/markdown"_kj, false});
    map.insert(".csv", {"text/csv"_kj, false});
    map.insert(".js", {"application/javascript"_kj, true});
    map.insert(".mjs", {"application/javascript"_kj, true});
    map.insert(".json", {"application/json"_kj, false});
    map.insert(".map", {"application/json"_kj, false});
    map.insert(".rss", {"application/rss+xml"_kj, true});
    map.insert(".atom", {"application/atom+xml"_kj, false});
    map.insert(".svg", {"image/svg+xml"_kj, false});
    map.insert(".svgz", {"image/svg+xml"_kj, false});
    map.insert(".png", {"image/png"_kj, false});
    map.insert(".jpg", {"image/jpeg"_kj, false});
    map.insert(".jpeg", {"image/jpeg"_kj, false});
    map.insert(".gif", {"image/gif"_kj, false});
    map.insert(".ico", {"image/x-icon"_kj, false});
    map.insert(".webp", {"image/webp"_kj, false});
    map.insert(".bmp", {"image/x-ms-bmp"_kj, false});
    map.insert(".woff", {"font/woff"_kj, false});
    map.insert(".woff2", {"font/woff2"_kj, false});
    map.insert(".ttf", {"font/ttf"_kj, false});
    map.insert(".otf", {"font/otf"_kj, false});
    map.insert(".eot", {"application/vnd.ms-fontobject"_kj, false});
    map.insert(".wasm", {"application/wasm"_kj, false});
    map.insert(".pdf", {"application/pdf"_kj, false});
    map.insert(".zip", {"application/zip"_kj, false});
    map.insert(".gz", {"application/gzip"_kj, false});
    map.insert(".tar", {"application/x-tar"_kj, false});
    map.insert(".mp3", {"audio/mpeg"_kj, false});
    map.insert(".mp4", {"video/mp4"_kj, false});
    map.insert(".webm", {"video/webm"_kj, false});
    return map;
  }();
  return mime_types;
}

constexpr kj::StringPtr DEFAULT_TYPE = "application/octet-stream"_kj;

// Extension of the last path component, dot included, lowercased.
// Hidden files such as ".gitignore" have none.
kj::String get_extension(kj::StringPtr name) {
  kj::StringPtr base = name;
  KJ_IF_SOME(lastSlash, name.findLast('/')) {
    base = name.slice(lastSlash + 1);
  }
  KJ_IF_SOME(lastDot, base.findLast('.')) {
    if (lastDot == 0) {
      return kj::str();
    }
    return http::lowercase(base.slice(lastDot));
  }
  return kj::str();
}

kj::Own<const kj::ReadableDirectory> open_document_root(kj::Filesystem& fs, kj::StringPtr root) {
  auto path = fs.getCurrentPath().evalNative(root);
  KJ_REQUIRE(fs.getRoot().exists(path), "document root does not exist", root);
  return fs.getRoot().openSubdir(kj::mv(path));
}

kj::Vector<kj::String> default_index_files() {
  kj::Vector<kj::String> names;
  names.add(kj::str("index.html"));
  names.add(kj::str("index.htm"));
  return names;
}

} // namespace

// ============================================================================
// StaticFileServer Implementation
// ============================================================================

StaticFileServer::StaticFileServer(Config config, const http::ResponseCompressor& compressor)
    : config_(kj::mv(config)), compressor_(compressor), fs_(kj::newDiskFilesystem()),
      rootDir_(open_document_root(*fs_, config_.documentRoot)) {
  if (config_.indexFiles.size() == 0) {
    config_.indexFiles = default_index_files();
  }
}

kj::Promise<void> StaticFileServer::serve_file(RequestContext& ctx) {
  try {
    auto decoded = kj::decodeUriComponent(ctx.path);
    if (decoded.hadErrors) {
      return send_error(ctx, 400, "Bad Request"_kj);
    }

    // Security check: prevent path traversal
    if (!is_safe_path(decoded)) {
      KJ_LOG(WARNING, "path traversal attempt blocked", ctx.path);
      return send_error(ctx, 403, "Forbidden"_kj);
    }

    auto resolved = resolve(decoded);
    KJ_IF_SOME(path, resolved) {
      if (ctx.method != kj::HttpMethod::GET && ctx.method != kj::HttpMethod::HEAD) {
        return send_error(ctx, 405, "Method Not Allowed"_kj);
      }
      return send_file_response(ctx, read_file(path));
    }

    return send_error(ctx, 404, "Not Found"_kj);
  } catch (const kj::Exception& e) {
    KJ_LOG(ERROR, "error serving static file", ctx.path, e);
    return send_error(ctx, 500, "Internal Server Error"_kj);
  }
}

kj::Maybe<kj::Path> StaticFileServer::resolve(kj::StringPtr path) const {
  size_t start = 0;
  while (start < path.size() && path[start] == '/') {
    ++start;
  }
  kj::StringPtr relative = path.slice(start);
  bool trailingSlash = relative.size() == 0 || relative.endsWith("/");

  kj::Path target = nullptr;
  try {
    target = kj::Path::parse(relative);
  } catch (const kj::Exception& e) {
    KJ_LOG(INFO, "unparseable request path", path, e.getDescription());
    return kj::none;
  }

  if (target.size() == 0) {
    return find_index(target);
  }

  auto type = node_type(target);
  KJ_IF_SOME(t, type) {
    if (t == kj::FsNode::Type::DIRECTORY) {
      return find_index(target);
    }
    // "file.html/" names a directory that does not exist
    if (t == kj::FsNode::Type::FILE && !trailingSlash) {
      return kj::mv(target);
    }
  }
  return kj::none;
}

kj::Maybe<kj::Path> StaticFileServer::find_index(kj::PathPtr dir) const {
  for (const auto& name : config_.indexFiles) {
    auto candidate = dir.append(name);
    auto type = node_type(candidate);
    KJ_IF_SOME(t, type) {
      if (t == kj::FsNode::Type::FILE) {
        return kj::mv(candidate);
      }
    }
  }
  return kj::none;
}

kj::Maybe<kj::FsNode::Type> StaticFileServer::node_type(kj::PathPtr path) const {
  auto meta = rootDir_->tryLstat(path);
  KJ_IF_SOME(m, meta) {
    if (m.type != kj::FsNode::Type::SYMLINK) {
      return m.type;
    }
    // Symlinks are followed
    auto target = rootDir_->tryOpenFile(path);
    KJ_IF_SOME(file, target) {
      return file->stat().type;
    }
  }
  return kj::none;
}

StaticFileServer::FileInfo StaticFileServer::read_file(kj::PathPtr path) const {
  auto file = rootDir_->openFile(path);
  auto meta = file->stat();
  KJ_REQUIRE(meta.size <= config_.maxFileSize, "file exceeds size limit", path.toString(),
             meta.size, config_.maxFileSize);

  return FileInfo{
      .content = file->readAllBytes(),
      .contentType = detect_content_type(path[path.size() - 1]),
      .lastModified = format_http_time(meta.lastModified),
  };
}

kj::String StaticFileServer::detect_content_type(kj::StringPtr name) const {
  auto ext = get_extension(name);
  if (ext.size() == 0) {
    return kj::str(DEFAULT_TYPE);
  }

  const auto& mimeTypes = get_mime_type_map();
  KJ_IF_SOME(mime, mimeTypes.find(ext)) {
    if (mime.text) {
      return kj::str(mime.type, "; charset=", config_.charset);
    }
    return kj::str(mime.type);
  }

  return kj::str(DEFAULT_TYPE);
}

bool StaticFileServer::is_safe_path(kj::StringPtr path) {
  if (path.findFirst('\0') != kj::none) {
    return false;
  }

  size_t segmentStart = 0;
  for (size_t i = 0; i <= path.size(); ++i) {
    if (i == path.size() || path[i] == '/') {
      if (i - segmentStart == 2 && path[segmentStart] == '.' && path[segmentStart + 1] == '.') {
        return false;
      }
      segmentStart = i + 1;
    }
  }
  return true;
}

kj::String StaticFileServer::format_http_time(kj::Date date) {
  static const char* const weekdays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static const char* const months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

  auto seconds = static_cast<time_t>((date - kj::UNIX_EPOCH) / kj::SECONDS);
  std::tm tm_val{};
  gmtime_r(&seconds, &tm_val);

  char buffer[64];
  snprintf(buffer, sizeof(buffer), "%s, %02d %s %04d %02d:%02d:%02d GMT",
           weekdays[tm_val.tm_wday], tm_val.tm_mday, months[tm_val.tm_mon],
           tm_val.tm_year + 1900, tm_val.tm_hour, tm_val.tm_min, tm_val.tm_sec);
  return kj::str(buffer);
}

kj::Promise<void> StaticFileServer::send_file_response(RequestContext& ctx, FileInfo info) {
  auto acceptEncoding = ctx.getHeader("Accept-Encoding"_kj).orDefault(""_kj);
  auto coding = compressor_.select(acceptEncoding, info.contentType, info.content.size());
  bool vary = compressor_.enabled() && compressor_.vary() &&
              compressor_.is_compressible_type(info.contentType);

  kj::Array<kj::byte> body;
  if (coding == http::ContentCoding::Gzip) {
    body = compressor_.gzip(info.content);
  } else {
    body = kj::mv(info.content);
  }

  kj::HttpHeaders headers(ctx.headerTable);
  headers.set(kj::HttpHeaderId::CONTENT_TYPE, kj::mv(info.contentType));
  headers.add("Last-Modified"_kj, kj::mv(info.lastModified));
  headers.add("Server"_kj, config_.serverName);
  if (coding != http::ContentCoding::Identity) {
    headers.add("Content-Encoding"_kj, http::coding_name(coding));
  }
  if (vary) {
    headers.add("Vary"_kj, "Accept-Encoding"_kj);
  }

  // Content-Length comes from the expected body size, for HEAD too
  auto stream = ctx.response.send(200, "OK"_kj, headers, body.size());
  if (ctx.method == kj::HttpMethod::HEAD) {
    return kj::READY_NOW;
  }

  auto writePromise = stream->write(body.asPtr());
  return writePromise.attach(kj::mv(stream), kj::mv(body));
}

kj::Promise<void> StaticFileServer::send_error(RequestContext& ctx, kj::uint status,
                                               kj::StringPtr statusText) {
  kj::HttpHeaders headers(ctx.headerTable);
  headers.set(kj::HttpHeaderId::CONTENT_TYPE, kj::str("text/plain; charset=", config_.charset));
  headers.add("Server"_kj, config_.serverName);
  if (status == 405) {
    headers.add("Allow"_kj, "GET, HEAD"_kj);
  }

  auto body = kj::str(status, " ", statusText, "\n");
  auto stream = ctx.response.send(status, statusText, headers, body.size());
  if (ctx.method == kj::HttpMethod::HEAD) {
    return kj::READY_NOW;
  }

  auto writePromise = stream->write(body.asBytes());
  return writePromise.attach(kj::mv(stream), kj::mv(body));
}

} // namespace rio::devserver
