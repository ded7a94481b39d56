// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "credentials_provider.hpp"

#include <aws/core/auth/AWSCredentialsProviderChain.h>

#include <variant>

namespace sluice {
namespace output {

namespace {

const char* const kAllocationTag = "SluiceCredentials";

struct ProviderVisitor {
  std::shared_ptr<Aws::Auth::AWSCredentialsProvider> operator()(const ExplicitKeys& keys) const {
    return Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(
      kAllocationTag, keys.access_key_id.c_str(), keys.secret_access_key.c_str()
    );
  }

  std::shared_ptr<Aws::Auth::AWSCredentialsProvider> operator()(
    const EnvironmentCredentials&
  ) const {
    return Aws::MakeShared<Aws::Auth::EnvironmentAWSCredentialsProvider>(kAllocationTag);
  }

  std::shared_ptr<Aws::Auth::AWSCredentialsProvider> operator()(
    const AmbientRoleCredentials&
  ) const {
    return Aws::MakeShared<Aws::Auth::DefaultAWSCredentialsProviderChain>(kAllocationTag);
  }
};

}  // namespace

std::shared_ptr<Aws::Auth::AWSCredentialsProvider> makeCredentialsProvider(
  const CredentialSource& source
) {
  return std::visit(ProviderVisitor{}, source);
}

}  // namespace output
}  // namespace sluice
