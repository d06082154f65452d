#ifndef AUTHKIT_OIDC_JWKS_CLIENT_H
#define AUTHKIT_OIDC_JWKS_CLIENT_H

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "authkit/auth/api_client.h"
#include "authkit/auth/memory_cache.h"
#include "authkit/core/compat.h"

/**
 * @file jwks_client.h
 * @brief JWKS endpoint client with caching and key rotation support
 */

namespace authkit {
namespace oidc {

/**
 * @brief JSON Web Key representation
 */
struct JsonWebKey {
  std::string kid;  // Key ID
  std::string kty;  // Key type (RSA, EC)
  std::string use;  // Key use (sig, enc)
  std::string alg;  // Algorithm (RS256, ES256, ...)

  // RSA
  std::string n;
  std::string e;

  // EC
  std::string crv;
  std::string x;
  std::string y;

  bool is_valid() const;

  enum class KeyType { RSA, EC, OCT, UNKNOWN };

  KeyType get_key_type() const;
};

struct JwksResponse {
  std::vector<JsonWebKey> keys;
  std::chrono::system_clock::time_point fetched_at;
  std::chrono::seconds cache_duration{0};

  optional<JsonWebKey> find_key(const std::string& kid) const;
  bool is_expired() const;
};

struct JwksClientConfig {
  std::string jwks_uri;
  std::chrono::seconds default_cache_duration;
  std::chrono::seconds min_cache_duration;
  std::chrono::seconds max_cache_duration;
  bool respect_cache_control;
  // Minimum spacing between refetches triggered by an unknown kid
  std::chrono::seconds min_refetch_interval;

  JwksClientConfig();
};

/**
 * @brief Fetches and caches the signing keys published by an issuer
 *
 * get_key() refetches once when asked for a kid that is not cached, so
 * keys rotated in since the last fetch are found without waiting for the
 * cache to expire.
 */
class JwksClient : public ApiClient {
 public:
  JwksClient(std::shared_ptr<HttpClient> http, const JwksClientConfig& config);

  /**
   * @brief Fetch the key set
   * @param force_refresh Bypass the cache
   * @throws ProtocolError, TransportError, PayloadError
   */
  JwksResponse fetch_keys(bool force_refresh = false);

  // nullopt when the kid is unknown even after a refetch
  optional<JsonWebKey> get_key(const std::string& kid);

  void clear_cache();

  struct CacheStats {
    size_t cache_hits;
    size_t cache_misses;
    size_t refresh_count;
  };

  CacheStats get_cache_stats() const;

  // nullopt when the document is not a key set
  static optional<JwksResponse> parse_jwks(const std::string& json);
  static std::chrono::seconds parse_cache_control(const std::string& header);

 private:
  JwksClientConfig config_;
  MemoryCache<std::string, JwksResponse> cache_;
  mutable std::mutex mutex_;
  std::chrono::steady_clock::time_point last_forced_refetch_{};
  size_t cache_hits_{0};
  size_t cache_misses_{0};
  size_t refresh_count_{0};
};

}  // namespace oidc
}  // namespace authkit

#endif  // AUTHKIT_OIDC_JWKS_CLIENT_H
