// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef RUNLIFT_AWS_CREDENTIALS_HPP
#define RUNLIFT_AWS_CREDENTIALS_HPP

#include <map>
#include <string>

namespace runlift {
namespace uploader {

/**
 * Credentials selected at startup. Exactly one of profile or
 * access_key/secret_key is populated after a successful resolve.
 */
struct AwsCredentialConfig {
  std::string profile;
  std::string access_key;
  std::string secret_key;

  bool useProfile() const { return !profile.empty(); }
};

using EnvironmentSnapshot = std::map<std::string, std::string>;

/**
 * Read AWS_DEFAULT_PROFILE, AWS_ACCESS_KEY and AWS_SECRET_KEY from the
 * process environment. Unset and empty variables are omitted.
 */
EnvironmentSnapshot captureAwsEnvironment();

/**
 * Pick the authentication method from an environment snapshot.
 *
 * A profile and explicit keys are mutually exclusive; having neither a
 * profile nor both keys is also an error.
 *
 * @param env Environment snapshot
 * @param out Resolved credentials (untouched on failure)
 * @param error_msg Human-readable reason on failure
 * @return true if credentials were resolved
 */
bool resolveCredentials(
  const EnvironmentSnapshot& env, AwsCredentialConfig& out, std::string& error_msg
);

}  // namespace uploader
}  // namespace runlift

#endif  // RUNLIFT_AWS_CREDENTIALS_HPP
