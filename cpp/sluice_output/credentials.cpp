// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "credentials.hpp"

#include <cstdlib>

#include "output_errors.hpp"

namespace sluice {
namespace output {

std::optional<std::string> systemEnv(const char* name) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

void validateCredentialPairing(const OutputConfig& config) {
  if (config.access_key_id.has_value() != config.secret_access_key.has_value()) {
    throw ConfigurationError(
      "access_key_id and secret_access_key must be configured together (got only " +
      std::string(config.access_key_id ? "access_key_id" : "secret_access_key") + ")"
    );
  }
}

CredentialSource resolveCredentials(const OutputConfig& config, const EnvLookup& env) {
  validateCredentialPairing(config);

  if (config.access_key_id) {
    return ExplicitKeys{*config.access_key_id, *config.secret_access_key};
  }
  if (env("AWS_ACCESS_KEY_ID")) {
    return EnvironmentCredentials{};
  }
  return AmbientRoleCredentials{};
}

const char* credentialSourceName(const CredentialSource& source) {
  switch (source.index()) {
    case 0:
      return "explicit";
    case 1:
      return "environment";
    case 2:
      return "ambient_role";
    default:
      return "unknown";
  }
}

}  // namespace output
}  // namespace sluice
