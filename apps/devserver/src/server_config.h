#pragma once

#include "middleware/status_override_middleware.h"
#include "static/static_file_server.h"

#include <cstdint>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/function.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <rio/http/content_encoding.h>

namespace rio::devserver {

/**
 * @brief Process-wide server configuration, built once at startup
 *
 * Every field can be set through a RIO_* environment variable; unset
 * variables keep the defaults below, which reproduce the original debug
 * image (port 80, gzip level 1 from 20 bytes for text/html without Vary,
 * keep-alive 65s, 1024 connections, 405 answered with the GET result).
 */
struct ServerConfig {
  using Lookup = kj::Function<kj::Maybe<kj::StringPtr>(kj::StringPtr name)>;

  // Listener
  kj::String host = kj::str("0.0.0.0");
  uint16_t port = 80;
  uint32_t max_connections = 1024;
  uint32_t keepalive_timeout_seconds = 65;
  uint32_t header_timeout_seconds = 60;

  // Static files
  kj::String document_root = kj::str("/srv/www");
  kj::Vector<kj::String> index_files;
  kj::String charset = kj::str("UTF-8");
  uint64_t max_file_size = 64 * 1024 * 1024;

  // Compression
  bool gzip_enabled = true;
  int gzip_level = 1;
  uint64_t gzip_min_length = 20;
  kj::Vector<kj::String> gzip_types;
  bool gzip_vary = false;

  // Method-rejection override
  bool override_405 = true;
  kj::Vector<kj::String> override_methods;

  // Logging
  bool access_log = true;
  kj::String log_level = kj::str("info");

  /**
   * @brief Build configuration from a variable lookup
   *
   * List-valued settings not provided by the lookup get their default
   * contents here, so this (not a default-constructed value) is the way to
   * obtain a complete configuration.
   *
   * @throws kj::Exception for values that do not parse
   */
  static ServerConfig load(Lookup lookup);

  /**
   * @brief Load configuration from the process environment
   */
  static ServerConfig loadFromEnv();

  /**
   * @brief Reject configurations the server cannot run with
   *
   * @throws kj::Exception describing the first invalid setting
   */
  void validate() const;

  /**
   * @brief KJ log severity named by log_level
   *
   * @throws kj::Exception for an unknown level name
   */
  kj::LogSeverity log_severity() const;

  /**
   * @brief Severity for a level name ("info", "warning", "error", any case), if known
   */
  static kj::Maybe<kj::LogSeverity> parse_log_level(kj::StringPtr name);

  // Component configurations derived from this one
  StaticFileServer::Config static_file_config() const;
  http::ResponseCompressor::Config compressor_config() const;
  StatusOverrideRule::Config override_config() const;

  /**
   * Header and keep-alive timeouts for kj::HttpServer. The error handler is
   * left for the caller to set.
   */
  kj::HttpServerSettings http_server_settings() const;
};

} // namespace rio::devserver
