/*
 * 설명: 사용자 디렉터리가 쓰는 MariaDB 접근 계층. 쿼리 단위 연결, 이스케이프된 SQL 조립, 연결 오류 재시도를 묶는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/user_directory_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

namespace presence {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

struct DbRetryPolicy {
  std::size_t max_attempts{3};
  std::chrono::milliseconds base_backoff{50};
  std::chrono::milliseconds max_jitter{25};
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

// NULL 컬럼은 std::nullopt.
using DbRow = std::vector<std::optional<std::string>>;
using SqlEscaper = std::function<std::string(const std::string&)>;
// 연결마다 다시 호출되므로 이스케이프는 그 연결의 문자셋을 따른다.
using SqlBuilder = std::function<std::string(const SqlEscaper&)>;

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config, const DbRetryPolicy& policy = DbRetryPolicy{});

  // 결과 집합이 없는 문장(DDL, INSERT, DELETE).
  void Execute(const SqlBuilder& build, const std::string& ctx) const;
  std::vector<DbRow> Query(const SqlBuilder& build, const std::string& ctx) const;

  // 시도 번호(1부터)를 받아 true면 연결 직후 CR_SERVER_LOST를 흉내 낸다.
  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

 private:
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;
  MYSQL* Connect() const;
  void RunStatement(MYSQL* conn, const SqlBuilder& build, const std::string& ctx) const;
  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;
  static bool IsRetryable(unsigned int code);
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  DbRetryPolicy policy_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace presence
