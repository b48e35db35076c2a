#include <chrono>
#include <cstdlib>
#include <memory>

#include <gtest/gtest.h>

#include "presence/db_client.hpp"
#include "presence/identity.hpp"
#include "presence/user_directory.hpp"

using namespace std::chrono_literals;

namespace {

presence::DbConfig TestDbConfig() {
  presence::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "app_db";
  return cfg;
}

class UserDirectoryItFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<presence::MariaDbClient>(
        TestDbConfig(), presence::DbRetryPolicy{.max_attempts = 3, .base_backoff = 5ms, .max_jitter = 5ms});
    directory_ = std::make_shared<presence::MariaDbUserDirectory>(db_client_);
    directory_->EnsureSchema();
    directory_->RemoveUser("it-user-1");
    directory_->RemoveUser("it-user-2");
  }

  void TearDown() override {
    db_client_->SetTransientInjector(nullptr);
    directory_->RemoveUser("it-user-1");
    directory_->RemoveUser("it-user-2");
  }

  std::shared_ptr<presence::MariaDbClient> db_client_;
  std::shared_ptr<presence::MariaDbUserDirectory> directory_;
};

}  // namespace

TEST_F(UserDirectoryItFixture, FindsStoredUser) {
  directory_->UpsertUser(presence::UserIdentity{"it-user-1", "통합 사용자"});
  auto found = directory_->FindUser("it-user-1");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->user_id, "it-user-1");
  EXPECT_EQ(found->display_name, "통합 사용자");
  EXPECT_FALSE(directory_->FindUser("it-user-2").has_value());
}

TEST_F(UserDirectoryItFixture, EscapesHostileIds) {
  directory_->UpsertUser(presence::UserIdentity{"it-user-1", "Alice"});
  EXPECT_FALSE(directory_->FindUser("it-user-1' OR '1'='1").has_value());
}

TEST_F(UserDirectoryItFixture, RetriesInjectedTransientFailure) {
  directory_->UpsertUser(presence::UserIdentity{"it-user-2", "Bob"});
  int attempts = 0;
  db_client_->SetTransientInjector([&attempts](std::size_t attempt) {
    ++attempts;
    return attempt == 1;
  });
  auto found = directory_->FindUser("it-user-2");
  db_client_->SetTransientInjector(nullptr);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->display_name, "Bob");
  EXPECT_EQ(attempts, 2);
}

TEST_F(UserDirectoryItFixture, GivesUpAfterRetryBudget) {
  int attempts = 0;
  db_client_->SetTransientInjector([&attempts](std::size_t) {
    ++attempts;
    return true;
  });
  try {
    directory_->FindUser("it-user-1");
    FAIL() << "DbException expected";
  } catch (const presence::DbException& ex) {
    EXPECT_TRUE(ex.retryable);
  }
  EXPECT_EQ(attempts, 3);
}

TEST_F(UserDirectoryItFixture, ResolverRejectsWhenDirectoryUnavailable) {
  db_client_->SetTransientInjector([](std::size_t) { return true; });
  presence::JwtIdentityResolver resolver("it-secret", directory_, nullptr);
  EXPECT_FALSE(resolver.Resolve(presence::MintHs256Token({{"userId", "it-user-1"}}, "it-secret")).has_value());
}

TEST_F(UserDirectoryItFixture, ResolverUsesDirectoryDisplayName) {
  directory_->UpsertUser(presence::UserIdentity{"it-user-1", "Directory Alice"});
  presence::JwtIdentityResolver resolver("it-secret", directory_, nullptr);
  auto identity =
      resolver.Resolve(presence::MintHs256Token({{"userId", "it-user-1"}, {"name", "Token Alice"}}, "it-secret"));
  ASSERT_TRUE(identity.has_value());
  EXPECT_EQ(identity->display_name, "Directory Alice");
  EXPECT_FALSE(resolver.Resolve(presence::MintHs256Token({{"userId", "it-user-2"}}, "it-secret")).has_value());
}
