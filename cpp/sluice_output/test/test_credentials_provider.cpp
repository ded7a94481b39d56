// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for the mapping from credential source to SDK provider
 *
 * Providers are only constructed, never asked to reach the network.
 */

#include <gtest/gtest.h>

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentialsProviderChain.h>

#include <memory>

#include "credentials_provider.hpp"

using namespace sluice::output;

TEST(CredentialsProviderTest, ExplicitKeysAreServedAsGiven) {
  auto provider = makeCredentialsProvider(ExplicitKeys{"AKIAEXAMPLE", "topsecret"});
  ASSERT_NE(provider, nullptr);

  Aws::Auth::AWSCredentials credentials = provider->GetAWSCredentials();
  EXPECT_EQ(credentials.GetAWSAccessKeyId(), "AKIAEXAMPLE");
  EXPECT_EQ(credentials.GetAWSSecretKey(), "topsecret");
}

TEST(CredentialsProviderTest, EnvironmentUsesEnvironmentProvider) {
  auto provider = makeCredentialsProvider(EnvironmentCredentials{});
  EXPECT_NE(
    std::dynamic_pointer_cast<Aws::Auth::EnvironmentAWSCredentialsProvider>(provider), nullptr
  );
}

TEST(CredentialsProviderTest, AmbientRoleUsesDefaultChain) {
  auto provider = makeCredentialsProvider(AmbientRoleCredentials{});
  EXPECT_NE(
    std::dynamic_pointer_cast<Aws::Auth::DefaultAWSCredentialsProviderChain>(provider), nullptr
  );
  EXPECT_EQ(
    std::dynamic_pointer_cast<Aws::Auth::InstanceProfileCredentialsProvider>(provider), nullptr
  );
}

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);

  Aws::SDKOptions options;
  options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
  Aws::InitAPI(options);
  int result = RUN_ALL_TESTS();
  Aws::ShutdownAPI(options);
  return result;
}
