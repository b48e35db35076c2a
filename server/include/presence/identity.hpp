/*
 * 설명: 핸드셰이크 자격 증명을 사용자 식별자로 해석하는 협력자 인터페이스와 HS256 토큰 구현을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/identity_test.cpp, server/tests/e2e/presence_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "presence/observability.hpp"

namespace presence {

struct UserIdentity {
  std::string user_id;
  std::string display_name;
};

class IdentityResolver {
 public:
  virtual ~IdentityResolver() = default;
  // 실패하면 nullopt. 호출자는 핸드셰이크를 거절해야 한다.
  virtual std::optional<UserIdentity> Resolve(const std::string& credential) = 0;
};

class UserDirectory {
 public:
  virtual ~UserDirectory() = default;
  virtual std::optional<UserIdentity> FindUser(const std::string& user_id) = 0;
};

class JwtIdentityResolver : public IdentityResolver {
 public:
  JwtIdentityResolver(std::string secret, std::shared_ptr<UserDirectory> directory,
                      std::shared_ptr<Observability> observability);

  std::optional<UserIdentity> Resolve(const std::string& credential) override;

 private:
  std::optional<nlohmann::json> VerifyClaims(const std::string& token, std::string& reason) const;
  void Reject(const std::string& reason) const;

  std::string secret_;
  std::shared_ptr<UserDirectory> directory_;
  std::shared_ptr<Observability> observability_;
};

// claims를 HS256으로 서명한 compact JWT를 만든다. 테스트와 개발용 토큰 발급에 쓴다.
std::string MintHs256Token(const nlohmann::json& claims, const std::string& secret);

}  // namespace presence
