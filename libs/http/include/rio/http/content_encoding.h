#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace rio::http {

/**
 * @brief Content codings the server knows how to produce.
 */
enum class ContentCoding : uint8_t {
  Identity = 0,
  Gzip = 1,
};

/**
 * @brief Token used in the Content-Encoding header for a coding.
 */
kj::StringPtr coding_name(ContentCoding coding);

inline kj::StringPtr KJ_STRINGIFY(ContentCoding coding) {
  return coding_name(coding);
}

/**
 * @brief Pick a response coding from an Accept-Encoding header value.
 *
 * Recognizes `gzip`, `x-gzip` and `*`. A q-value of zero disables the coding.
 * Matching is case-insensitive.
 *
 * @param acceptEncoding Header value, or empty if the header was absent
 * @return Gzip when acceptable, Identity otherwise
 */
ContentCoding negotiate_coding(kj::StringPtr acceptEncoding);

/**
 * @brief Strip parameters from a Content-Type value and lowercase it.
 *
 * "text/html; charset=UTF-8" -> "text/html"
 */
kj::String media_type_of(kj::StringPtr contentType);

/**
 * Response compressor.
 *
 * Decides whether a body is eligible for compression and produces the
 * encoded bytes. Holds only immutable settings, so a single instance can be
 * shared by every request on the event loop.
 */
class ResponseCompressor {
public:
  struct Config {
    bool enabled = true;
    int level = 1;              // zlib level, 1-9
    uint64_t minLength = 20;    // bodies shorter than this are sent as-is
    kj::Vector<kj::String> types; // compressible media types; empty means text/html
    bool vary = false;          // emit Vary: Accept-Encoding for compressible types
  };

  explicit ResponseCompressor(Config config);

  /**
   * @brief Media types compressed when the caller supplies none.
   */
  static kj::Vector<kj::String> default_types();

  /**
   * @brief Whether the media type is in the compressible list.
   *
   * Size is not considered; used to decide on the Vary header.
   */
  bool is_compressible_type(kj::StringPtr contentType) const;

  /**
   * @brief Full eligibility check for a response body.
   *
   * @param acceptEncoding Request Accept-Encoding value (empty if absent)
   * @param contentType Response Content-Type
   * @param size Uncompressed body size
   * @return Coding to apply
   */
  ContentCoding select(kj::StringPtr acceptEncoding, kj::StringPtr contentType,
                       uint64_t size) const;

  /**
   * @brief Encode a body with gzip at the configured level.
   */
  kj::Array<kj::byte> gzip(kj::ArrayPtr<const kj::byte> body) const;

  bool enabled() const {
    return config_.enabled;
  }
  bool vary() const {
    return config_.vary;
  }
  int level() const {
    return config_.level;
  }

private:
  Config config_;
};

} // namespace rio::http
