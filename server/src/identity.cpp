/*
 * 설명: HS256 서명 토큰을 검증해 사용자 식별자를 얻고, 설정된 경우 사용자 디렉터리로 존재를 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/identity_test.cpp
 */
#include "presence/identity.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace presence {
namespace {
std::string Base64UrlEncode(const std::string& data) {
  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(len));
  while (!out.empty() && out.back() == '=') {
    out.pop_back();
  }
  std::replace(out.begin(), out.end(), '+', '-');
  std::replace(out.begin(), out.end(), '/', '_');
  return out;
}

std::optional<std::string> Base64UrlDecode(const std::string& input) {
  std::string b64 = input;
  std::replace(b64.begin(), b64.end(), '-', '+');
  std::replace(b64.begin(), b64.end(), '_', '/');
  std::size_t padding = 0;
  while (b64.size() % 4 != 0) {
    b64.push_back('=');
    ++padding;
  }
  if (padding > 2) {
    return std::nullopt;
  }
  std::string out(b64.size() / 4 * 3, '\0');
  int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            reinterpret_cast<const unsigned char*>(b64.data()), static_cast<int>(b64.size()));
  if (len < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock은 패딩 바이트까지 길이에 포함한다.
  out.resize(static_cast<std::size_t>(len) - padding);
  return out;
}

std::string HmacSha256(const std::string& key, const std::string& data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &digest_len)) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::optional<std::string> ClaimAsString(const nlohmann::json& claims, const char* key) {
  auto it = claims.find(key);
  if (it == claims.end()) {
    return std::nullopt;
  }
  if (it->is_string() && !it->get<std::string>().empty()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<long long>());
  }
  return std::nullopt;
}
}  // namespace

JwtIdentityResolver::JwtIdentityResolver(std::string secret, std::shared_ptr<UserDirectory> directory,
                                         std::shared_ptr<Observability> observability)
    : secret_(std::move(secret)), directory_(std::move(directory)), observability_(std::move(observability)) {}

std::optional<UserIdentity> JwtIdentityResolver::Resolve(const std::string& credential) {
  if (credential.empty()) {
    Reject("no_token");
    return std::nullopt;
  }
  std::string reason;
  auto claims = VerifyClaims(credential, reason);
  if (!claims) {
    Reject(reason);
    return std::nullopt;
  }
  auto user_id = ClaimAsString(*claims, "userId");
  if (!user_id) {
    user_id = ClaimAsString(*claims, "sub");
  }
  if (!user_id) {
    Reject("missing_user_id");
    return std::nullopt;
  }

  if (directory_) {
    std::optional<UserIdentity> found;
    try {
      found = directory_->FindUser(*user_id);
    } catch (const std::exception& ex) {
      Reject(std::string("directory_error: ") + ex.what());
      return std::nullopt;
    }
    if (!found) {
      Reject("user_not_found");
    }
    return found;
  }

  auto name = ClaimAsString(*claims, "name");
  return UserIdentity{*user_id, name ? *name : *user_id};
}

std::optional<nlohmann::json> JwtIdentityResolver::VerifyClaims(const std::string& token, std::string& reason) const {
  if (secret_.empty()) {
    reason = "secret_not_configured";
    return std::nullopt;
  }
  auto first_dot = token.find('.');
  auto second_dot = first_dot == std::string::npos ? std::string::npos : token.find('.', first_dot + 1);
  if (second_dot == std::string::npos || token.find('.', second_dot + 1) != std::string::npos) {
    reason = "malformed_token";
    return std::nullopt;
  }
  const auto signing_input = token.substr(0, second_dot);
  auto header = Base64UrlDecode(token.substr(0, first_dot));
  auto payload = Base64UrlDecode(token.substr(first_dot + 1, second_dot - first_dot - 1));
  auto signature = Base64UrlDecode(token.substr(second_dot + 1));
  if (!header || !payload || !signature) {
    reason = "malformed_token";
    return std::nullopt;
  }

  auto header_json = nlohmann::json::parse(*header, nullptr, false);
  if (header_json.is_discarded() || !header_json.is_object() || header_json.value("alg", "") != "HS256") {
    reason = "unsupported_algorithm";
    return std::nullopt;
  }

  auto expected = HmacSha256(secret_, signing_input);
  if (expected.empty() || expected.size() != signature->size() ||
      CRYPTO_memcmp(expected.data(), signature->data(), expected.size()) != 0) {
    reason = "invalid_signature";
    return std::nullopt;
  }

  auto claims = nlohmann::json::parse(*payload, nullptr, false);
  if (claims.is_discarded() || !claims.is_object()) {
    reason = "malformed_claims";
    return std::nullopt;
  }
  auto exp_it = claims.find("exp");
  if (exp_it != claims.end() && exp_it->is_number()) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    if (exp_it->get<double>() <= static_cast<double>(now)) {
      reason = "token_expired";
      return std::nullopt;
    }
  }
  return claims;
}

void JwtIdentityResolver::Reject(const std::string& reason) const {
  if (observability_) {
    observability_->Log(
        LogContext{.level = LogLevel::kWarn, .name = "handshake.rejected", .detail = {{"reason", reason}}});
  }
}

std::string MintHs256Token(const nlohmann::json& claims, const std::string& secret) {
  nlohmann::json header{{"alg", "HS256"}, {"typ", "JWT"}};
  auto signing_input = Base64UrlEncode(header.dump()) + "." + Base64UrlEncode(claims.dump());
  return signing_input + "." + Base64UrlEncode(HmacSha256(secret, signing_input));
}

}  // namespace presence
