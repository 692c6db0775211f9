#include "rio/http/content_encoding.h"

#include "rio/http/text_util.h"

#include <kj/compat/gzip.h>
#include <kj/debug.h>
#include <kj/io.h>

namespace rio::http {

namespace {

// q-value of one Accept-Encoding parameter list. Anything that does not look
// like a zero counts as acceptable, matching lenient server behavior.
double parse_qvalue(kj::ArrayPtr<const kj::String> params) {
  for (const auto& raw : params) {
    auto param = trim(raw);
    if (param.size() >= 2 && to_lower(param[0]) == 'q' && param[1] == '=') {
      kj::StringPtr value = param.slice(2);
      if (value.size() == 0) {
        return 1.0;
      }
      if (value[0] == '0') {
        // "0", "0.", "0.000" all disable; "0.5" does not
        for (size_t i = 1; i < value.size(); ++i) {
          char c = value[i];
          if (c != '.' && c != '0') {
            return 0.5;
          }
        }
        return 0.0;
      }
      return 1.0;
    }
  }
  return 1.0;
}

} // namespace

kj::StringPtr coding_name(ContentCoding coding) {
  switch (coding) {
  case ContentCoding::Gzip:
    return "gzip"_kj;
  case ContentCoding::Identity:
    return "identity"_kj;
  }
  KJ_UNREACHABLE;
}

ContentCoding negotiate_coding(kj::StringPtr acceptEncoding) {
  bool gzipAllowed = false;
  bool gzipRefused = false;
  bool wildcardAllowed = false;

  for (const auto& element : split(acceptEncoding, ',')) {
    auto pieces = split(element, ';');
    auto name = lowercase(trim(pieces[0]));
    double q = parse_qvalue(pieces.asPtr().slice(1, pieces.size()));

    if (name == "gzip"_kj || name == "x-gzip"_kj) {
      if (q > 0) {
        gzipAllowed = true;
      } else {
        gzipRefused = true;
      }
    } else if (name == "*"_kj && q > 0) {
      wildcardAllowed = true;
    }
  }

  if (gzipAllowed || (wildcardAllowed && !gzipRefused)) {
    return ContentCoding::Gzip;
  }
  return ContentCoding::Identity;
}

kj::String media_type_of(kj::StringPtr contentType) {
  auto pieces = split(contentType, ';');
  return lowercase(trim(pieces[0]));
}

ResponseCompressor::ResponseCompressor(Config config) : config_(kj::mv(config)) {
  KJ_REQUIRE(config_.level >= 1 && config_.level <= 9, "gzip level must be within 1-9",
             config_.level);
  if (config_.types.size() == 0) {
    config_.types = default_types();
  }
  for (auto& type : config_.types) {
    type = lowercase(type);
  }
}

kj::Vector<kj::String> ResponseCompressor::default_types() {
  // nginx compresses text/html only unless gzip_types says otherwise
  kj::Vector<kj::String> types;
  types.add(kj::str("text/html"));
  return types;
}

bool ResponseCompressor::is_compressible_type(kj::StringPtr contentType) const {
  auto mediaType = media_type_of(contentType);
  for (const auto& type : config_.types) {
    if (type == mediaType) {
      return true;
    }
  }
  return false;
}

ContentCoding ResponseCompressor::select(kj::StringPtr acceptEncoding, kj::StringPtr contentType,
                                         uint64_t size) const {
  if (!config_.enabled || size < config_.minLength) {
    return ContentCoding::Identity;
  }
  if (!is_compressible_type(contentType)) {
    return ContentCoding::Identity;
  }
  return negotiate_coding(acceptEncoding);
}

kj::Array<kj::byte> ResponseCompressor::gzip(kj::ArrayPtr<const kj::byte> body) const {
  kj::VectorOutputStream sink(body.size() / 2 + 64);
  {
    // The trailer is written when the gzip stream is destroyed.
    kj::GzipOutputStream gz(sink, config_.level);
    gz.write(body);
  }
  return kj::heapArray<kj::byte>(sink.getArray());
}

} // namespace rio::http
