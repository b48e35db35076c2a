/*
 * 설명: MariaDB users 테이블에서 사용자 표시 이름을 조회하는 디렉터리 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/user_directory_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "presence/db_client.hpp"
#include "presence/identity.hpp"

namespace presence {

class MariaDbUserDirectory : public UserDirectory {
 public:
  explicit MariaDbUserDirectory(std::shared_ptr<MariaDbClient> db_client);

  std::optional<UserIdentity> FindUser(const std::string& user_id) override;

  void EnsureSchema();
  void UpsertUser(const UserIdentity& user);
  void RemoveUser(const std::string& user_id);

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace presence
