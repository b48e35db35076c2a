/*
 * 설명: 연결 재시도 정책을 따라 users 테이블을 조회/갱신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/user_directory_it_test.cpp
 */
#include "presence/user_directory.hpp"

namespace presence {

MariaDbUserDirectory::MariaDbUserDirectory(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::optional<UserIdentity> MariaDbUserDirectory::FindUser(const std::string& user_id) {
  auto rows = db_client_->Query(
      [&](const SqlEscaper& escape) {
        return "SELECT id, display_name FROM users WHERE id = '" + escape(user_id) + "' LIMIT 1;";
      },
      "사용자 조회 실패");
  if (rows.empty() || !rows.front()[0]) {
    return std::nullopt;
  }
  const auto& row = rows.front();
  return UserIdentity{*row[0], row[1] ? *row[1] : *row[0]};
}

void MariaDbUserDirectory::EnsureSchema() {
  db_client_->Execute(
      [](const SqlEscaper&) {
        return std::string(
            "CREATE TABLE IF NOT EXISTS users ("
            "id VARCHAR(64) NOT NULL PRIMARY KEY, "
            "display_name VARCHAR(255) NOT NULL) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;");
      },
      "users 테이블 생성 실패");
}

void MariaDbUserDirectory::UpsertUser(const UserIdentity& user) {
  db_client_->Execute(
      [&](const SqlEscaper& escape) {
        return "INSERT INTO users(id, display_name) VALUES ('" + escape(user.user_id) + "', '" +
               escape(user.display_name) + "') ON DUPLICATE KEY UPDATE display_name = VALUES(display_name);";
      },
      "사용자 저장 실패");
}

void MariaDbUserDirectory::RemoveUser(const std::string& user_id) {
  db_client_->Execute(
      [&](const SqlEscaper& escape) { return "DELETE FROM users WHERE id = '" + escape(user_id) + "';"; },
      "사용자 삭제 실패");
}

}  // namespace presence
