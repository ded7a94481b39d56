// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_CREDENTIALS_PROVIDER_HPP
#define SLUICE_CREDENTIALS_PROVIDER_HPP

#include <aws/core/auth/AWSCredentialsProvider.h>

#include <memory>

#include "credentials.hpp"

namespace sluice {
namespace output {

/**
 * Maps a resolved credential source to the matching SDK provider.
 *
 *   ExplicitKeys           -> SimpleAWSCredentialsProvider
 *   EnvironmentCredentials -> EnvironmentAWSCredentialsProvider
 *   AmbientRoleCredentials -> DefaultAWSCredentialsProviderChain (profile file,
 *                             ECS container, web identity, instance profile)
 *
 * Requires Aws::InitAPI to have run.
 */
std::shared_ptr<Aws::Auth::AWSCredentialsProvider> makeCredentialsProvider(
  const CredentialSource& source
);

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_CREDENTIALS_PROVIDER_HPP
