#include "authkit/oidc/jwks_client.h"

#include <algorithm>
#include <regex>

#include <nlohmann/json.hpp>

#include "authkit/auth/auth_error.h"

#define AUTHKIT_LOG_COMPONENT "authkit.validator.jwks"
#include "authkit/logging/log_macros.h"

namespace authkit {
namespace oidc {

namespace {

const char kCacheKey[] = "jwks";

std::string optional_string(const nlohmann::json& object, const char* key) {
  auto it = object.find(key);
  if (it != object.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return "";
}

}  // namespace

bool JsonWebKey::is_valid() const {
  if (kid.empty() || kty.empty()) {
    return false;
  }
  if (kty == "RSA") {
    return !n.empty() && !e.empty();
  }
  if (kty == "EC") {
    return !crv.empty() && !x.empty() && !y.empty();
  }
  // Symmetric and unknown key types are never accepted from a JWKS
  return false;
}

JsonWebKey::KeyType JsonWebKey::get_key_type() const {
  if (kty == "RSA") return KeyType::RSA;
  if (kty == "EC") return KeyType::EC;
  if (kty == "oct") return KeyType::OCT;
  return KeyType::UNKNOWN;
}

optional<JsonWebKey> JwksResponse::find_key(const std::string& kid) const {
  for (const auto& key : keys) {
    if (key.kid == kid && key.is_valid()) {
      return key;
    }
  }
  return nullopt;
}

bool JwksResponse::is_expired() const {
  return std::chrono::system_clock::now() - fetched_at >= cache_duration;
}

JwksClientConfig::JwksClientConfig()
    : default_cache_duration(3600),
      min_cache_duration(60),
      max_cache_duration(86400),
      respect_cache_control(true),
      min_refetch_interval(30) {}

JwksClient::JwksClient(std::shared_ptr<HttpClient> http,
                       const JwksClientConfig& config)
    : ApiClient(std::move(http), config.jwks_uri),
      config_(config),
      cache_(1, config.default_cache_duration) {}

JwksResponse JwksClient::fetch_keys(bool force_refresh) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!force_refresh) {
    auto cached = cache_.get(kCacheKey);
    if (cached) {
      ++cache_hits_;
      return *cached;
    }
  }
  ++cache_misses_;

  HttpResponse response = http_->get(endpoint_uri_);
  nlohmann::json payload = checked_json(response);

  auto jwks = parse_jwks(payload.dump());
  if (!jwks) {
    throw PayloadError("JWKS document from " + endpoint_uri_ +
                           " has no 'keys' array",
                       response.status_code);
  }

  auto cache_duration = config_.default_cache_duration;
  if (config_.respect_cache_control) {
    auto cache_control = response.header("Cache-Control");
    if (cache_control) {
      cache_duration = std::max(
          config_.min_cache_duration,
          std::min(parse_cache_control(*cache_control),
                   config_.max_cache_duration));
    }
  }

  jwks->cache_duration = cache_duration;
  jwks->fetched_at = std::chrono::system_clock::now();
  cache_.put(kCacheKey, *jwks, cache_duration);
  ++refresh_count_;

  AUTHKIT_LOG(Debug, "Fetched {} signing keys from {}", jwks->keys.size(),
              endpoint_uri_);
  return *jwks;
}

optional<JsonWebKey> JwksClient::get_key(const std::string& kid) {
  auto key = fetch_keys(false).find_key(kid);
  if (key) {
    return key;
  }

  auto now = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_forced_refetch_ != std::chrono::steady_clock::time_point{} &&
        now - last_forced_refetch_ < config_.min_refetch_interval) {
      return nullopt;
    }
    last_forced_refetch_ = now;
  }

  AUTHKIT_LOG(Info, "Unknown signing key '{}', refetching {}", kid,
              endpoint_uri_);
  return fetch_keys(true).find_key(kid);
}

void JwksClient::clear_cache() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
}

JwksClient::CacheStats JwksClient::get_cache_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats stats;
  stats.cache_hits = cache_hits_;
  stats.cache_misses = cache_misses_;
  stats.refresh_count = refresh_count_;
  return stats;
}

optional<JwksResponse> JwksClient::parse_jwks(const std::string& json) {
  nlohmann::json j = nlohmann::json::parse(json, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("keys") ||
      !j["keys"].is_array()) {
    return nullopt;
  }

  JwksResponse response;
  for (const auto& key_json : j["keys"]) {
    if (!key_json.is_object()) {
      continue;
    }
    JsonWebKey key;
    key.kid = optional_string(key_json, "kid");
    key.kty = optional_string(key_json, "kty");
    key.use = optional_string(key_json, "use");
    key.alg = optional_string(key_json, "alg");
    key.n = optional_string(key_json, "n");
    key.e = optional_string(key_json, "e");
    key.crv = optional_string(key_json, "crv");
    key.x = optional_string(key_json, "x");
    key.y = optional_string(key_json, "y");

    if (key.is_valid()) {
      response.keys.push_back(key);
    }
  }
  return response;
}

std::chrono::seconds JwksClient::parse_cache_control(
    const std::string& header) {
  static const std::regex max_age_regex("max-age=(\\d+)");
  std::smatch match;

  if (std::regex_search(header, match, max_age_regex) && match.size() > 1) {
    try {
      return std::chrono::seconds(std::stol(match[1]));
    } catch (const std::exception&) {
      // Out of range; fall through to the default
    }
  }
  return std::chrono::seconds(3600);
}

}  // namespace oidc
}  // namespace authkit
