// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for credential resolution
 */

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>
#include <variant>

#include "credentials.hpp"
#include "output_errors.hpp"

using namespace sluice::output;

class CredentialsTest : public ::testing::Test {
protected:
  EnvLookup env() {
    return [this](const char* name) -> std::optional<std::string> {
      auto it = env_.find(name);
      if (it == env_.end()) {
        return std::nullopt;
      }
      return it->second;
    };
  }

  OutputConfig config_;
  std::map<std::string, std::string> env_;
};

TEST_F(CredentialsTest, ExplicitKeysWin) {
  config_.access_key_id = "AKIAEXAMPLE";
  config_.secret_access_key = "secret";
  env_["AWS_ACCESS_KEY_ID"] = "from-env";

  CredentialSource source = resolveCredentials(config_, env());
  ASSERT_TRUE(std::holds_alternative<ExplicitKeys>(source));
  EXPECT_EQ(std::get<ExplicitKeys>(source).access_key_id, "AKIAEXAMPLE");
  EXPECT_EQ(std::get<ExplicitKeys>(source).secret_access_key, "secret");
  EXPECT_STREQ(credentialSourceName(source), "explicit");
}

TEST_F(CredentialsTest, EnvironmentWhenAccessKeySet) {
  env_["AWS_ACCESS_KEY_ID"] = "from-env";

  CredentialSource source = resolveCredentials(config_, env());
  EXPECT_TRUE(std::holds_alternative<EnvironmentCredentials>(source));
  EXPECT_STREQ(credentialSourceName(source), "environment");
}

TEST_F(CredentialsTest, AmbientRoleOtherwise) {
  CredentialSource source = resolveCredentials(config_, env());
  EXPECT_TRUE(std::holds_alternative<AmbientRoleCredentials>(source));
  EXPECT_STREQ(credentialSourceName(source), "ambient_role");
}

TEST_F(CredentialsTest, SecretAloneInEnvironmentIsNotEnough) {
  env_["AWS_SECRET_ACCESS_KEY"] = "secret";

  CredentialSource source = resolveCredentials(config_, env());
  EXPECT_TRUE(std::holds_alternative<AmbientRoleCredentials>(source));
}

TEST_F(CredentialsTest, AccessKeyWithoutSecretRejected) {
  config_.access_key_id = "AKIAEXAMPLE";

  EXPECT_THROW(validateCredentialPairing(config_), ConfigurationError);
  EXPECT_THROW(resolveCredentials(config_, env()), ConfigurationError);
}

TEST_F(CredentialsTest, SecretWithoutAccessKeyRejected) {
  config_.secret_access_key = "secret";

  EXPECT_THROW(validateCredentialPairing(config_), ConfigurationError);
  EXPECT_THROW(resolveCredentials(config_, env()), ConfigurationError);
}

TEST_F(CredentialsTest, NeitherKeyIsValid) {
  EXPECT_NO_THROW(validateCredentialPairing(config_));
}
