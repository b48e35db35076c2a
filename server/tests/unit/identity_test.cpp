#include <chrono>
#include <memory>
#include <stdexcept>

#include <gtest/gtest.h>

#include "presence/db_client.hpp"
#include "presence/identity.hpp"

namespace {
constexpr const char* kSecret = "unit-test-secret";

long long NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

class FakeDirectory : public presence::UserDirectory {
 public:
  std::optional<presence::UserIdentity> FindUser(const std::string& user_id) override {
    ++lookups;
    if (fail) {
      throw presence::DbException("사용자 조회 실패", 2013, true);
    }
    if (user_id == "u1") {
      return presence::UserIdentity{"u1", "Directory Name"};
    }
    return std::nullopt;
  }

  int lookups{0};
  bool fail{false};
};

presence::JwtIdentityResolver MakeResolver(std::shared_ptr<presence::UserDirectory> directory = nullptr) {
  return presence::JwtIdentityResolver(kSecret, std::move(directory),
                                       std::make_shared<presence::Observability>(presence::LogLevel::kError));
}
}  // namespace

TEST(IdentityTest, ResolvesUserIdAndNameFromClaims) {
  auto resolver = MakeResolver();
  auto token = presence::MintHs256Token({{"userId", "u1"}, {"name", "Alice"}, {"exp", NowSeconds() + 60}}, kSecret);
  auto identity = resolver.Resolve(token);
  ASSERT_TRUE(identity.has_value());
  EXPECT_EQ(identity->user_id, "u1");
  EXPECT_EQ(identity->display_name, "Alice");
}

TEST(IdentityTest, FallsBackToSubAndUserIdAsName) {
  auto resolver = MakeResolver();
  auto identity = resolver.Resolve(presence::MintHs256Token({{"sub", 42}}, kSecret));
  ASSERT_TRUE(identity.has_value());
  EXPECT_EQ(identity->user_id, "42");
  EXPECT_EQ(identity->display_name, "42");
}

TEST(IdentityTest, RejectsBadSignatureAndTampering) {
  auto resolver = MakeResolver();
  EXPECT_FALSE(resolver.Resolve(presence::MintHs256Token({{"userId", "u1"}}, "other-secret")).has_value());

  auto token = presence::MintHs256Token({{"userId", "u1"}}, kSecret);
  auto tampered = token;
  tampered[tampered.find('.') + 2] = tampered[tampered.find('.') + 2] == 'A' ? 'B' : 'A';
  EXPECT_FALSE(resolver.Resolve(tampered).has_value());
}

TEST(IdentityTest, RejectsMalformedExpiredAndEmptyCredentials) {
  auto resolver = MakeResolver();
  EXPECT_FALSE(resolver.Resolve("").has_value());
  EXPECT_FALSE(resolver.Resolve("not-a-token").has_value());
  EXPECT_FALSE(resolver.Resolve("a.b.c.d").has_value());
  EXPECT_FALSE(resolver.Resolve(presence::MintHs256Token({{"userId", "u1"}, {"exp", NowSeconds() - 10}}, kSecret))
                   .has_value());
  EXPECT_FALSE(resolver.Resolve(presence::MintHs256Token({{"name", "nobody"}}, kSecret)).has_value());
}

TEST(IdentityTest, EmptySecretRejectsEverything) {
  presence::JwtIdentityResolver resolver("", nullptr, nullptr);
  EXPECT_FALSE(resolver.Resolve(presence::MintHs256Token({{"userId", "u1"}}, "")).has_value());
}

TEST(IdentityTest, DirectoryNameWinsAndUnknownUserRejected) {
  auto directory = std::make_shared<FakeDirectory>();
  auto resolver = MakeResolver(directory);

  auto identity = resolver.Resolve(presence::MintHs256Token({{"userId", "u1"}, {"name", "Token Name"}}, kSecret));
  ASSERT_TRUE(identity.has_value());
  EXPECT_EQ(identity->display_name, "Directory Name");

  EXPECT_FALSE(resolver.Resolve(presence::MintHs256Token({{"userId", "u2"}}, kSecret)).has_value());
  EXPECT_EQ(directory->lookups, 2);
}

TEST(IdentityTest, DirectoryFailureRejectsHandshake) {
  auto directory = std::make_shared<FakeDirectory>();
  directory->fail = true;
  auto resolver = MakeResolver(directory);
  EXPECT_FALSE(resolver.Resolve(presence::MintHs256Token({{"userId", "u1"}}, kSecret)).has_value());
}
