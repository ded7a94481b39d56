// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_CREDENTIALS_HPP
#define SLUICE_CREDENTIALS_HPP

#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "output_config.hpp"

namespace sluice {
namespace output {

/**
 * access_key_id / secret_access_key pair taken from the configuration
 */
struct ExplicitKeys {
  std::string access_key_id;
  std::string secret_access_key;
};

/**
 * AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY (/ AWS_SESSION_TOKEN) from the environment
 */
struct EnvironmentCredentials {};

/**
 * Whatever the host provides: shared profile file, ECS task role, web
 * identity token or EC2 instance profile, tried in that order
 */
struct AmbientRoleCredentials {};

using CredentialSource =
  std::variant<ExplicitKeys, EnvironmentCredentials, AmbientRoleCredentials>;

/**
 * Environment lookup, injectable for tests. Returns std::nullopt for unset
 * or empty variables.
 */
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

std::optional<std::string> systemEnv(const char* name);

/**
 * Check that access_key_id and secret_access_key are both set or both unset.
 *
 * @throws ConfigurationError otherwise
 */
void validateCredentialPairing(const OutputConfig& config);

/**
 * Select the credential source, in priority order:
 *   1. explicit keys from the configuration
 *   2. environment credentials, when AWS_ACCESS_KEY_ID is set
 *   3. the ambient role of the host
 *
 * @throws ConfigurationError on a half-configured key pair
 */
CredentialSource resolveCredentials(const OutputConfig& config, const EnvLookup& env = systemEnv);

const char* credentialSourceName(const CredentialSource& source);

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_CREDENTIALS_HPP
