/*
 * 설명: 쿼리마다 MariaDB 연결을 열고, 연결 계열 오류만 지터 백오프로 다시 시도한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/user_directory_it_test.cpp
 */
#include "presence/db_client.hpp"

#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace presence {

MariaDbClient::MariaDbClient(const DbConfig& config, const DbRetryPolicy& policy)
    : config_(config), policy_(policy) {
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
}

void MariaDbClient::Execute(const SqlBuilder& build, const std::string& ctx) const {
  WithConnectionRetry([&](MYSQL* conn) { RunStatement(conn, build, ctx); });
}

std::vector<DbRow> MariaDbClient::Query(const SqlBuilder& build, const std::string& ctx) const {
  std::vector<DbRow> rows;
  WithConnectionRetry([&](MYSQL* conn) {
    rows.clear();
    RunStatement(conn, build, ctx);
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      RaiseError(conn, ctx + " (결과 없음)");
    }
    const unsigned int columns = mysql_num_fields(res);
    while (MYSQL_ROW row = mysql_fetch_row(res)) {
      DbRow values;
      values.reserve(columns);
      for (unsigned int i = 0; i < columns; ++i) {
        values.push_back(row[i] ? std::optional<std::string>(row[i]) : std::nullopt);
      }
      rows.push_back(std::move(values));
    }
    mysql_free_result(res);
  });
  return rows;
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  for (std::size_t attempt = 1;; ++attempt) {
    MYSQL* conn = nullptr;
    try {
      conn = Connect();
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", CR_SERVER_LOST, true);
      }
      work(conn);
      mysql_close(conn);
      return;
    } catch (const DbException& ex) {
      if (conn) {
        mysql_close(conn);
      }
      if (ex.retryable && attempt < policy_.max_attempts) {
        Backoff(attempt);
        continue;
      }
      throw;
    } catch (...) {
      if (conn) {
        mysql_close(conn);
      }
      throw;
    }
  }
}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 핸들 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  // 표시 이름은 한글/이모지를 포함할 수 있다.
  mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    unsigned int code = mysql_errno(conn);
    std::string message = std::string("사용자 DB 연결 실패: ") + mysql_error(conn);
    mysql_close(conn);
    throw DbException(message, code, IsRetryable(code));
  }
  return conn;
}

void MariaDbClient::RunStatement(MYSQL* conn, const SqlBuilder& build, const std::string& ctx) const {
  const SqlEscaper escape = [conn](const std::string& value) {
    std::string escaped(value.size() * 2 + 1, '\0');
    auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
    escaped.resize(len);
    return escaped;
  };
  const std::string sql = build(escape);
  if (mysql_real_query(conn, sql.data(), sql.size()) != 0) {
    RaiseError(conn, ctx);
  }
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  throw DbException(ctx + ": " + mysql_error(conn), code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) {
  return code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR || code == CR_CONN_HOST_ERROR ||
         code == CR_CONNECTION_ERROR;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  auto delay = policy_.base_backoff * (1u << (attempt - 1));
  if (policy_.max_jitter.count() > 0) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<long long> dist(0, policy_.max_jitter.count());
    delay += std::chrono::milliseconds(dist(gen));
  }
  std::this_thread::sleep_for(delay);
}

}  // namespace presence
