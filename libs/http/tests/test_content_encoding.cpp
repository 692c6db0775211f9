#include "kj/test.h"
#include "rio/http/content_encoding.h"

#include <kj/compat/gzip.h>
#include <kj/io.h>
#include <kj/string.h>

using namespace rio::http;

namespace {

kj::String inflate(kj::ArrayPtr<const kj::byte> data) {
  kj::ArrayInputStream raw(data);
  kj::GzipInputStream gz(raw);
  auto bytes = gz.readAllBytes();
  return kj::heapString(reinterpret_cast<const char*>(bytes.begin()), bytes.size());
}

ResponseCompressor::Config default_config() {
  ResponseCompressor::Config config;
  return config;
}

// ============================================================================
// Accept-Encoding negotiation
// ============================================================================

KJ_TEST("negotiate_coding: gzip listed among other codings") {
  KJ_EXPECT(negotiate_coding("gzip, deflate, br"_kj) == ContentCoding::Gzip);
  KJ_EXPECT(negotiate_coding("br, gzip"_kj) == ContentCoding::Gzip);
  KJ_EXPECT(negotiate_coding("x-gzip"_kj) == ContentCoding::Gzip);
}

KJ_TEST("negotiate_coding: token matching is case-insensitive") {
  KJ_EXPECT(negotiate_coding("GZip"_kj) == ContentCoding::Gzip);
  KJ_EXPECT(negotiate_coding(" gzip ;Q=1"_kj) == ContentCoding::Gzip);
}

KJ_TEST("negotiate_coding: absent or unsupported codings give identity") {
  KJ_EXPECT(negotiate_coding(""_kj) == ContentCoding::Identity);
  KJ_EXPECT(negotiate_coding("deflate, br"_kj) == ContentCoding::Identity);
  KJ_EXPECT(negotiate_coding("identity"_kj) == ContentCoding::Identity);
}

KJ_TEST("negotiate_coding: zero q-value refuses gzip") {
  KJ_EXPECT(negotiate_coding("gzip;q=0"_kj) == ContentCoding::Identity);
  KJ_EXPECT(negotiate_coding("gzip; q=0.000"_kj) == ContentCoding::Identity);
  KJ_EXPECT(negotiate_coding("gzip;q=0.001"_kj) == ContentCoding::Gzip);
  KJ_EXPECT(negotiate_coding("gzip;q=0.5, br"_kj) == ContentCoding::Gzip);
}

KJ_TEST("negotiate_coding: wildcard") {
  KJ_EXPECT(negotiate_coding("*"_kj) == ContentCoding::Gzip);
  KJ_EXPECT(negotiate_coding("*;q=0"_kj) == ContentCoding::Identity);
  // An explicit refusal wins over the wildcard
  KJ_EXPECT(negotiate_coding("*, gzip;q=0"_kj) == ContentCoding::Identity);
}

KJ_TEST("media_type_of: strips parameters and lowercases") {
  KJ_EXPECT(media_type_of("Text/HTML; charset=UTF-8"_kj) == "text/html"_kj);
  KJ_EXPECT(media_type_of("application/json"_kj) == "application/json"_kj);
  KJ_EXPECT(media_type_of(""_kj) == ""_kj);
}

// ============================================================================
// ResponseCompressor
// ============================================================================

KJ_TEST("ResponseCompressor: defaults match the debug image") {
  ResponseCompressor compressor(default_config());

  KJ_EXPECT(compressor.enabled());
  KJ_EXPECT(!compressor.vary());
  KJ_EXPECT(compressor.level() == 1);
  KJ_EXPECT(compressor.is_compressible_type("text/html; charset=UTF-8"_kj));
  KJ_EXPECT(compressor.is_compressible_type("TEXT/HTML"_kj));
  KJ_EXPECT(!compressor.is_compressible_type("text/css"_kj));
  KJ_EXPECT(!compressor.is_compressible_type("application/javascript"_kj));
  KJ_EXPECT(!compressor.is_compressible_type("image/svg+xml"_kj));
  KJ_EXPECT(!compressor.is_compressible_type("image/png"_kj));
  KJ_EXPECT(!compressor.is_compressible_type("application/octet-stream"_kj));
}

KJ_TEST("ResponseCompressor: select applies type, length and negotiation") {
  ResponseCompressor compressor(default_config());

  KJ_EXPECT(compressor.select("gzip"_kj, "text/html; charset=UTF-8"_kj, 100) ==
            ContentCoding::Gzip);
  KJ_EXPECT(compressor.select("gzip"_kj, "text/html"_kj, 20) == ContentCoding::Gzip);
  KJ_EXPECT(compressor.select("gzip"_kj, "text/html"_kj, 19) == ContentCoding::Identity);
  KJ_EXPECT(compressor.select("gzip"_kj, "image/png"_kj, 4096) == ContentCoding::Identity);
  KJ_EXPECT(compressor.select(""_kj, "text/html"_kj, 4096) == ContentCoding::Identity);
}

KJ_TEST("ResponseCompressor: disabled never compresses") {
  auto config = default_config();
  config.enabled = false;
  ResponseCompressor compressor(kj::mv(config));

  KJ_EXPECT(compressor.select("gzip"_kj, "text/html"_kj, 4096) == ContentCoding::Identity);
}

KJ_TEST("ResponseCompressor: custom type list replaces the defaults") {
  auto config = default_config();
  config.types.add(kj::str("Application/Wasm"));
  ResponseCompressor compressor(kj::mv(config));

  KJ_EXPECT(compressor.is_compressible_type("application/wasm"_kj));
  KJ_EXPECT(!compressor.is_compressible_type("text/html"_kj));
}

KJ_TEST("ResponseCompressor: gzip output inflates to the input") {
  auto config = default_config();
  config.level = 6;
  ResponseCompressor compressor(kj::mv(config));

  auto filler = kj::heapString(4000);
  for (char& c : filler) {
    c = 'x';
  }
  auto text = kj::str("<html><body>", filler, "</body></html>");
  auto encoded = compressor.gzip(text.asBytes());

  KJ_EXPECT(encoded.size() < text.size());
  KJ_ASSERT(encoded.size() >= 2);
  KJ_EXPECT(encoded[0] == 0x1f);
  KJ_EXPECT(encoded[1] == 0x8b);
  KJ_EXPECT(inflate(encoded) == text);
}

KJ_TEST("ResponseCompressor: gzip of empty body is a valid stream") {
  ResponseCompressor compressor(default_config());
  auto encoded = compressor.gzip(nullptr);
  KJ_EXPECT(inflate(encoded) == ""_kj);
}

KJ_TEST("ResponseCompressor: level outside 1-9 is rejected") {
  auto config = default_config();
  config.level = 0;
  KJ_EXPECT_THROW_MESSAGE("gzip level", ResponseCompressor(kj::mv(config)));

  auto config2 = default_config();
  config2.level = 10;
  KJ_EXPECT_THROW_MESSAGE("gzip level", ResponseCompressor(kj::mv(config2)));
}

} // namespace
