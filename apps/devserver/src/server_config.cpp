#include "server_config.h"

#include <cstdlib>
#include <rio/http/text_util.h>

namespace rio::devserver {

namespace {

using http::lowercase;
using http::split_list;
using http::trim;
using http::uppercase;

bool parse_bool(kj::StringPtr name, kj::StringPtr value) {
  auto v = trim(value);
  if (v == "true"_kj || v == "1"_kj || v == "yes"_kj || v == "on"_kj) {
    return true;
  }
  if (v == "false"_kj || v == "0"_kj || v == "no"_kj || v == "off"_kj) {
    return false;
  }
  KJ_FAIL_REQUIRE("expected a boolean", name, value);
}

uint64_t parse_unsigned(kj::StringPtr name, kj::StringPtr value, uint64_t max) {
  auto v = trim(value);
  KJ_REQUIRE(v.size() > 0 && v[0] != '-', "expected a non-negative integer", name, value);
  uint64_t parsed = 0;
  KJ_IF_SOME(e, kj::runCatchingExceptions([&]() { parsed = v.parseAs<uint64_t>(); })) {
    KJ_FAIL_REQUIRE("expected a non-negative integer", name, value, e.getDescription());
  }
  KJ_REQUIRE(parsed <= max, "value out of range", name, parsed, max);
  return parsed;
}

kj::Vector<kj::String> copy_list(const kj::Vector<kj::String>& list) {
  kj::Vector<kj::String> out(list.size());
  for (const auto& item : list) {
    out.add(kj::str(item));
  }
  return out;
}

} // namespace

ServerConfig ServerConfig::load(Lookup lookup) {
  ServerConfig config;

  // Listener
  KJ_IF_SOME(host, lookup("RIO_HOST")) {
    config.host = trim(host);
  }
  KJ_IF_SOME(port, lookup("RIO_PORT")) {
    config.port = static_cast<uint16_t>(parse_unsigned("RIO_PORT", port, 65535));
  }
  KJ_IF_SOME(connections, lookup("RIO_MAX_CONNECTIONS")) {
    config.max_connections =
        static_cast<uint32_t>(parse_unsigned("RIO_MAX_CONNECTIONS", connections, UINT32_MAX));
  }
  KJ_IF_SOME(keepalive, lookup("RIO_KEEPALIVE_TIMEOUT")) {
    config.keepalive_timeout_seconds =
        static_cast<uint32_t>(parse_unsigned("RIO_KEEPALIVE_TIMEOUT", keepalive, 86400));
  }
  KJ_IF_SOME(headerTimeout, lookup("RIO_HEADER_TIMEOUT")) {
    config.header_timeout_seconds =
        static_cast<uint32_t>(parse_unsigned("RIO_HEADER_TIMEOUT", headerTimeout, 86400));
  }

  // Static files
  KJ_IF_SOME(root, lookup("RIO_DOCUMENT_ROOT")) {
    config.document_root = trim(root);
  }
  config.index_files = split_list(lookup("RIO_INDEX_FILES").orDefault("index.html,index.htm"_kj));
  KJ_IF_SOME(charset, lookup("RIO_CHARSET")) {
    config.charset = trim(charset);
  }
  KJ_IF_SOME(maxSize, lookup("RIO_MAX_FILE_SIZE")) {
    config.max_file_size = parse_unsigned("RIO_MAX_FILE_SIZE", maxSize, UINT64_MAX);
  }

  // Compression
  KJ_IF_SOME(gzip, lookup("RIO_GZIP")) {
    config.gzip_enabled = parse_bool("RIO_GZIP", gzip);
  }
  KJ_IF_SOME(level, lookup("RIO_GZIP_LEVEL")) {
    config.gzip_level = static_cast<int>(parse_unsigned("RIO_GZIP_LEVEL", level, 9));
  }
  KJ_IF_SOME(minLength, lookup("RIO_GZIP_MIN_LENGTH")) {
    config.gzip_min_length = parse_unsigned("RIO_GZIP_MIN_LENGTH", minLength, UINT64_MAX);
  }
  KJ_IF_SOME(types, lookup("RIO_GZIP_TYPES")) {
    config.gzip_types = split_list(types);
  }
  else {
    config.gzip_types = http::ResponseCompressor::default_types();
  }
  KJ_IF_SOME(vary, lookup("RIO_GZIP_VARY")) {
    config.gzip_vary = parse_bool("RIO_GZIP_VARY", vary);
  }

  // Method-rejection override
  KJ_IF_SOME(override405, lookup("RIO_OVERRIDE_405")) {
    config.override_405 = parse_bool("RIO_OVERRIDE_405", override405);
  }
  for (auto& method : split_list(lookup("RIO_OVERRIDE_METHODS").orDefault("*"_kj))) {
    config.override_methods.add(uppercase(method));
  }

  // Logging
  KJ_IF_SOME(accessLog, lookup("RIO_ACCESS_LOG")) {
    config.access_log = parse_bool("RIO_ACCESS_LOG", accessLog);
  }
  KJ_IF_SOME(logLevel, lookup("RIO_LOG_LEVEL")) {
    config.log_level = trim(logLevel);
  }

  return config;
}

ServerConfig ServerConfig::loadFromEnv() {
  return load([](kj::StringPtr name) -> kj::Maybe<kj::StringPtr> {
    if (const char* value = std::getenv(name.cStr())) {
      return kj::StringPtr(value);
    }
    return kj::none;
  });
}

void ServerConfig::validate() const {
  if (port == 0) {
    KJ_FAIL_REQUIRE("Invalid port number: 0");
  }
  if (host.size() == 0) {
    KJ_FAIL_REQUIRE("Bind address must not be empty");
  }
  if (max_connections == 0) {
    KJ_FAIL_REQUIRE("Connection budget must be > 0");
  }
  if (document_root.size() == 0) {
    KJ_FAIL_REQUIRE("Document root must not be empty");
  }
  if (index_files.size() == 0) {
    KJ_FAIL_REQUIRE("At least one index file name is required");
  }
  for (const auto& name : index_files) {
    if (name.findFirst('/') != kj::none || name == "."_kj || name == ".."_kj) {
      KJ_FAIL_REQUIRE("Index file must be a plain file name", name);
    }
  }
  if (gzip_level < 1 || gzip_level > 9) {
    KJ_FAIL_REQUIRE("gzip level must be within 1-9", gzip_level);
  }
  if (override_methods.size() == 0) {
    KJ_FAIL_REQUIRE("Override method list must not be empty; use * for every method");
  }
  if (parse_log_level(log_level) == kj::none) {
    KJ_FAIL_REQUIRE("Unknown log level (expected info, warning or error)", log_level);
  }

  if (keepalive_timeout_seconds == 0) {
    KJ_LOG(WARNING, "Keep-alive disabled: RIO_KEEPALIVE_TIMEOUT is 0");
  }
  if (!override_405) {
    KJ_LOG(WARNING, "405 override disabled; non-GET requests to files will be rejected");
  }
}

kj::Maybe<kj::LogSeverity> ServerConfig::parse_log_level(kj::StringPtr value) {
  auto name = lowercase(trim(value));
  if (name == "info"_kj) {
    return kj::LogSeverity::INFO;
  }
  if (name == "warning"_kj) {
    return kj::LogSeverity::WARNING;
  }
  if (name == "error"_kj) {
    return kj::LogSeverity::ERROR;
  }
  return kj::none;
}

kj::LogSeverity ServerConfig::log_severity() const {
  KJ_IF_SOME(severity, parse_log_level(log_level)) {
    return severity;
  }
  KJ_FAIL_REQUIRE("Unknown log level (expected info, warning or error)", log_level);
}

StaticFileServer::Config ServerConfig::static_file_config() const {
  StaticFileServer::Config config;
  config.documentRoot = kj::str(document_root);
  config.indexFiles = copy_list(index_files);
  config.charset = kj::str(charset);
  config.maxFileSize = max_file_size;
  return config;
}

http::ResponseCompressor::Config ServerConfig::compressor_config() const {
  http::ResponseCompressor::Config config;
  config.enabled = gzip_enabled;
  config.level = gzip_level;
  config.minLength = gzip_min_length;
  config.types = copy_list(gzip_types);
  config.vary = gzip_vary;
  return config;
}

StatusOverrideRule::Config ServerConfig::override_config() const {
  StatusOverrideRule::Config config;
  config.enabled = override_405;
  config.methods = copy_list(override_methods);
  return config;
}

kj::HttpServerSettings ServerConfig::http_server_settings() const {
  kj::HttpServerSettings settings;
  settings.headerTimeout = header_timeout_seconds * kj::SECONDS;
  settings.pipelineTimeout = keepalive_timeout_seconds * kj::SECONDS;
  return settings;
}

} // namespace rio::devserver
