#include "authkit/auth/auth_client_config.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "authkit/auth/auth_error.h"
#include "authkit/auth/auth_util.h"

#define AUTHKIT_LOG_COMPONENT "authkit.config"
#include "authkit/logging/log_macros.h"

namespace authkit {

namespace {

const char kSecretSuffix[] = "_secret";
const char kPubkeySuffix[] = "_pubkey";

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) ==
             0;
}

// ---- JSON field readers ----

optional<std::string> optional_string(const nlohmann::json& json,
                                      const char* key) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return nullopt;
  }
  if (!it->is_string()) {
    throw ConfigError("must be a string", key);
  }
  return it->get<std::string>();
}

std::string required_string(const nlohmann::json& json, const char* key) {
  auto value = optional_string(json, key);
  if (!value || value->empty()) {
    throw ConfigError("is required", key);
  }
  return *value;
}

std::vector<std::string> string_list(const nlohmann::json& json,
                                     const char* key) {
  std::vector<std::string> result;
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return result;
  }
  if (it->is_string()) {
    return util::split_whitespace(it->get<std::string>());
  }
  if (!it->is_array()) {
    throw ConfigError("must be a list of strings", key);
  }
  for (const auto& entry : *it) {
    if (!entry.is_string()) {
      throw ConfigError("must be a list of strings", key);
    }
    result.push_back(entry.get<std::string>());
  }
  return result;
}

void put(nlohmann::json& json, const char* key,
         const optional<std::string>& value) {
  if (value) {
    json[key] = *value;
  }
}

// ---- struct <-> JSON ----

OidcServerConfig parse_server(const nlohmann::json& json) {
  OidcServerConfig server;
  server.auth_server = required_string(json, "auth_server");
  server.client_id = required_string(json, "client_id");
  server.issuer = optional_string(json, "issuer");
  server.audiences = string_list(json, "audiences");
  server.scopes = string_list(json, "scopes");
  server.organization = optional_string(json, "organization");
  server.project_id = optional_string(json, "project_id");
  server.authorization_endpoint =
      optional_string(json, "authorization_endpoint");
  server.device_authorization_endpoint =
      optional_string(json, "device_authorization_endpoint");
  server.token_endpoint = optional_string(json, "token_endpoint");
  server.introspection_endpoint =
      optional_string(json, "introspection_endpoint");
  server.revocation_endpoint = optional_string(json, "revocation_endpoint");
  server.userinfo_endpoint = optional_string(json, "userinfo_endpoint");
  server.jwks_endpoint = optional_string(json, "jwks_endpoint");
  server.ca_bundle = optional_string(json, "ca_bundle");
  return server;
}

void write_server(nlohmann::json& json, const OidcServerConfig& server) {
  json["auth_server"] = server.auth_server;
  json["client_id"] = server.client_id;
  put(json, "issuer", server.issuer);
  if (!server.audiences.empty()) {
    json["audiences"] = server.audiences;
  }
  if (!server.scopes.empty()) {
    json["scopes"] = server.scopes;
  }
  put(json, "organization", server.organization);
  put(json, "project_id", server.project_id);
  put(json, "authorization_endpoint", server.authorization_endpoint);
  put(json, "device_authorization_endpoint",
      server.device_authorization_endpoint);
  put(json, "token_endpoint", server.token_endpoint);
  put(json, "introspection_endpoint", server.introspection_endpoint);
  put(json, "revocation_endpoint", server.revocation_endpoint);
  put(json, "userinfo_endpoint", server.userinfo_endpoint);
  put(json, "jwks_endpoint", server.jwks_endpoint);
  put(json, "ca_bundle", server.ca_bundle);
}

enum class AuthKind { PUBLIC, SECRET, PUBKEY };

ClientAuthConfig parse_client_auth(const nlohmann::json& json, AuthKind kind) {
  switch (kind) {
    case AuthKind::SECRET: {
      ClientSecretConfig secret;
      secret.client_secret = required_string(json, "client_secret");
      auto method = optional_string(json, "client_secret_auth_method");
      if (method) {
        if (*method == "basic" || *method == "client_secret_basic") {
          secret.auth_method = ClientSecretAuthMethod::BASIC;
        } else if (*method == "post" || *method == "client_secret_post") {
          secret.auth_method = ClientSecretAuthMethod::POST;
        } else {
          throw ConfigError("must be 'basic' or 'post'",
                            "client_secret_auth_method");
        }
      }
      return secret;
    }
    case AuthKind::PUBKEY: {
      ClientPubkeyConfig pubkey;
      pubkey.client_privkey = optional_string(json, "client_privkey");
      pubkey.client_privkey_file = optional_string(json, "client_privkey_file");
      pubkey.client_privkey_password =
          optional_string(json, "client_privkey_password");
      return pubkey;
    }
    case AuthKind::PUBLIC:
      break;
  }
  return PublicClientAuth{};
}

struct ClientAuthWriter {
  nlohmann::json& json;

  void operator()(const PublicClientAuth&) const {}
  void operator()(const ClientSecretConfig& secret) const {
    json["client_secret"] = secret.client_secret;
    json["client_secret_auth_method"] =
        secret.auth_method == ClientSecretAuthMethod::POST ? "post" : "basic";
  }
  void operator()(const ClientPubkeyConfig& pubkey) const {
    put(json, "client_privkey", pubkey.client_privkey);
    put(json, "client_privkey_file", pubkey.client_privkey_file);
    put(json, "client_privkey_password", pubkey.client_privkey_password);
  }
};

std::string auth_suffix(const ClientAuthConfig& client_auth) {
  if (holds_alternative<ClientSecretConfig>(client_auth)) {
    return kSecretSuffix;
  }
  if (holds_alternative<ClientPubkeyConfig>(client_auth)) {
    return kPubkeySuffix;
  }
  return "";
}

struct ClientTypeVisitor {
  std::string operator()(const AuthCodeClientConfig& c) const {
    return "oidc_auth_code" + auth_suffix(c.client_auth);
  }
  std::string operator()(const DeviceCodeClientConfig& c) const {
    return "oidc_device_code" + auth_suffix(c.client_auth);
  }
  std::string operator()(const ClientCredentialsClientConfig& c) const {
    return "oidc_client_credentials" + auth_suffix(c.client_auth);
  }
  std::string operator()(const ResourceOwnerClientConfig& c) const {
    return "oidc_resource_owner" + auth_suffix(c.client_auth);
  }
  std::string operator()(const ClientValidatorConfig&) const {
    return "oidc_client_validator";
  }
  std::string operator()(const PlanetLegacyClientConfig&) const {
    return "planet_legacy";
  }
  std::string operator()(const StaticApiKeyClientConfig&) const {
    return "static_apikey";
  }
  std::string operator()(const NoneClientConfig&) const { return "none"; }
};

struct ToJsonVisitor {
  nlohmann::json& json;

  void operator()(const AuthCodeClientConfig& c) const {
    write_server(json, c.server);
    visit(ClientAuthWriter{json}, c.client_auth);
    put(json, "redirect_uri", c.redirect_uri);
    put(json, "local_redirect_uri", c.local_redirect_uri);
    put(json, "authorization_callback_acknowledgement",
        c.authorization_callback_acknowledgement);
    put(json, "authorization_callback_acknowledgement_file",
        c.authorization_callback_acknowledgement_file);
  }
  void operator()(const DeviceCodeClientConfig& c) const {
    write_server(json, c.server);
    visit(ClientAuthWriter{json}, c.client_auth);
  }
  void operator()(const ClientCredentialsClientConfig& c) const {
    write_server(json, c.server);
    visit(ClientAuthWriter{json}, c.client_auth);
  }
  void operator()(const ResourceOwnerClientConfig& c) const {
    write_server(json, c.server);
    visit(ClientAuthWriter{json}, c.client_auth);
  }
  void operator()(const ClientValidatorConfig& c) const {
    write_server(json, c.server);
  }
  void operator()(const PlanetLegacyClientConfig& c) const {
    json["legacy_auth_endpoint"] = c.legacy_auth_endpoint;
    put(json, "api_key", c.api_key);
  }
  void operator()(const StaticApiKeyClientConfig& c) const {
    json["api_key"] = c.api_key;
    json["bearer_token_prefix"] = c.bearer_token_prefix;
  }
  void operator()(const NoneClientConfig&) const {}
};

struct ServerVisitor {
  const OidcServerConfig* operator()(const AuthCodeClientConfig& c) const {
    return &c.server;
  }
  const OidcServerConfig* operator()(const DeviceCodeClientConfig& c) const {
    return &c.server;
  }
  const OidcServerConfig* operator()(
      const ClientCredentialsClientConfig& c) const {
    return &c.server;
  }
  const OidcServerConfig* operator()(const ResourceOwnerClientConfig& c) const {
    return &c.server;
  }
  const OidcServerConfig* operator()(const ClientValidatorConfig& c) const {
    return &c.server;
  }
  template <typename T>
  const OidcServerConfig* operator()(const T&) const {
    return nullptr;
  }
};

void validate_client_auth(const ClientAuthConfig& client_auth) {
  if (auto secret = get_if<ClientSecretConfig>(&client_auth)) {
    if (secret->client_secret.empty()) {
      throw ConfigError("is required", "client_secret");
    }
  }
  if (auto pubkey = get_if<ClientPubkeyConfig>(&client_auth)) {
    if (!pubkey->client_privkey && !pubkey->client_privkey_file) {
      throw ConfigError("client_privkey or client_privkey_file is required",
                        "client_privkey");
    }
  }
}

const ClientAuthConfig* client_auth_of(const AuthClientConfig::Variant& v) {
  if (auto c = get_if<AuthCodeClientConfig>(&v)) return &c->client_auth;
  if (auto c = get_if<DeviceCodeClientConfig>(&v)) return &c->client_auth;
  if (auto c = get_if<ClientCredentialsClientConfig>(&v)) return &c->client_auth;
  if (auto c = get_if<ResourceOwnerClientConfig>(&v)) return &c->client_auth;
  return nullptr;
}

// ---- YAML ----

nlohmann::json yaml_to_json(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Map: {
      nlohmann::json object = nlohmann::json::object();
      for (const auto& entry : node) {
        object[entry.first.as<std::string>()] = yaml_to_json(entry.second);
      }
      return object;
    }
    case YAML::NodeType::Sequence: {
      nlohmann::json array = nlohmann::json::array();
      for (const auto& entry : node) {
        array.push_back(yaml_to_json(entry));
      }
      return array;
    }
    case YAML::NodeType::Scalar:
      // Every configuration value is a string; "client_id: 12345" included
      return node.as<std::string>();
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      break;
  }
  return nullptr;
}

std::string read_text_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Cannot read configuration file " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

std::string decrypt_sops_file(const std::string& path) {
  auto result = util::run_process({"sops", "-d", path});
  if (result.exit_status != 0) {
    throw ConfigError("sops could not decrypt " + path + " (status " +
                      std::to_string(result.exit_status) + ")");
  }
  return result.output;
}

}  // namespace

std::string normalize_client_type(const std::string& client_type) {
  std::string normalized = client_type;
  std::replace(normalized.begin(), normalized.end(), '-', '_');
  return normalized;
}

AuthClientConfig::AuthClientConfig(Variant config) : config_(std::move(config)) {
  validate();
}

void AuthClientConfig::validate() const {
  if (const OidcServerConfig* server = oidc_server()) {
    if (server->auth_server.empty()) {
      throw ConfigError("is required", "auth_server");
    }
    if (server->client_id.empty()) {
      throw ConfigError("is required", "client_id");
    }
    if (server->audiences.size() > 1) {
      throw ConfigError("only one audience is permitted", "audiences");
    }
  }
  if (const ClientAuthConfig* client_auth = client_auth_of(config_)) {
    validate_client_auth(*client_auth);
  }
  if (auto cc = get_if<ClientCredentialsClientConfig>(&config_)) {
    if (holds_alternative<PublicClientAuth>(cc->client_auth)) {
      throw ConfigError(
          "client credentials clients need a secret or a private key",
          "client_type");
    }
  }
  if (auto ac = get_if<AuthCodeClientConfig>(&config_)) {
    if (!ac->redirect_uri && !ac->local_redirect_uri) {
      throw ConfigError("redirect_uri or local_redirect_uri is required",
                        "redirect_uri");
    }
  }
  if (auto key = get_if<StaticApiKeyClientConfig>(&config_)) {
    if (key->api_key.empty()) {
      throw ConfigError("is required", "api_key");
    }
  }
  if (auto legacy = get_if<PlanetLegacyClientConfig>(&config_)) {
    if (legacy->legacy_auth_endpoint.empty()) {
      throw ConfigError("is required", "legacy_auth_endpoint");
    }
  }
}

AuthClientConfig AuthClientConfig::from_json(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw ConfigError("Client configuration must be a JSON object");
  }
  const std::string type =
      normalize_client_type(required_string(json, "client_type"));

  if (type == "oidc_client_validator") {
    return AuthClientConfig(ClientValidatorConfig{parse_server(json)});
  }
  if (type == "planet_legacy") {
    PlanetLegacyClientConfig legacy;
    legacy.legacy_auth_endpoint = optional_string(json, "legacy_auth_endpoint")
                                      .value_or(kDefaultLegacyAuthEndpoint);
    legacy.api_key = optional_string(json, "api_key");
    return AuthClientConfig(legacy);
  }
  if (type == "static_apikey") {
    StaticApiKeyClientConfig key;
    key.api_key = required_string(json, "api_key");
    key.bearer_token_prefix =
        optional_string(json, "bearer_token_prefix").value_or("Bearer");
    return AuthClientConfig(key);
  }
  if (type == "none") {
    return AuthClientConfig(NoneClientConfig{});
  }

  std::string base = type;
  AuthKind kind = AuthKind::PUBLIC;
  if (ends_with(type, kSecretSuffix)) {
    kind = AuthKind::SECRET;
    base = type.substr(0, type.size() - sizeof(kSecretSuffix) + 1);
  } else if (ends_with(type, kPubkeySuffix)) {
    kind = AuthKind::PUBKEY;
    base = type.substr(0, type.size() - sizeof(kPubkeySuffix) + 1);
  }

  if (base == "oidc_auth_code") {
    AuthCodeClientConfig config;
    config.server = parse_server(json);
    config.client_auth = parse_client_auth(json, kind);
    config.redirect_uri = optional_string(json, "redirect_uri");
    config.local_redirect_uri = optional_string(json, "local_redirect_uri");
    config.authorization_callback_acknowledgement =
        optional_string(json, "authorization_callback_acknowledgement");
    config.authorization_callback_acknowledgement_file =
        optional_string(json, "authorization_callback_acknowledgement_file");
    return AuthClientConfig(std::move(config));
  }
  if (base == "oidc_device_code") {
    return AuthClientConfig(DeviceCodeClientConfig{
        parse_server(json), parse_client_auth(json, kind)});
  }
  if (base == "oidc_client_credentials" && kind != AuthKind::PUBLIC) {
    return AuthClientConfig(ClientCredentialsClientConfig{
        parse_server(json), parse_client_auth(json, kind)});
  }
  if (base == "oidc_resource_owner") {
    return AuthClientConfig(ResourceOwnerClientConfig{
        parse_server(json), parse_client_auth(json, kind)});
  }
  throw ConfigError("Unknown client type '" + type + "'", "client_type");
}

AuthClientConfig AuthClientConfig::from_file(const std::string& path) {
  const bool sops = ends_with(path, ".sops.json") ||
                    ends_with(path, ".sops.yaml") ||
                    ends_with(path, ".sops.yml");
  const bool yaml = ends_with(path, ".yaml") || ends_with(path, ".yml");
  AUTHKIT_LOG(Debug, "Loading client configuration from {}", path);

  const std::string content =
      sops ? decrypt_sops_file(path) : read_text_file(path);
  nlohmann::json json;
  if (yaml) {
    try {
      json = yaml_to_json(YAML::Load(content));
    } catch (const YAML::Exception& e) {
      throw ConfigError(path + " is not valid YAML: " + e.what());
    }
  } else {
    json = nlohmann::json::parse(content, nullptr, false);
    if (json.is_discarded()) {
      throw ConfigError(path + " is not valid JSON");
    }
  }
  return from_json(json);
}

nlohmann::json AuthClientConfig::to_json() const {
  nlohmann::json json = nlohmann::json::object();
  json["client_type"] = client_type();
  visit(ToJsonVisitor{json}, config_);
  return json;
}

std::string AuthClientConfig::client_type() const {
  return visit(ClientTypeVisitor{}, config_);
}

const OidcServerConfig* AuthClientConfig::oidc_server() const {
  return visit(ServerVisitor{}, config_);
}

}  // namespace authkit
