// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "aws_credentials.hpp"

#include <cstdlib>

#define RUNLIFT_LOG_COMPONENT "aws_credentials"
#include <runlift_log_macros.hpp>

namespace runlift {
namespace uploader {

using ::runlift::logging::kv;

namespace {

const char* const kProfileVar = "AWS_DEFAULT_PROFILE";
const char* const kAccessKeyVar = "AWS_ACCESS_KEY";
const char* const kSecretKeyVar = "AWS_SECRET_KEY";

std::string lookup(const EnvironmentSnapshot& env, const char* name) {
  auto it = env.find(name);
  return it == env.end() ? std::string() : it->second;
}

}  // namespace

EnvironmentSnapshot captureAwsEnvironment() {
  EnvironmentSnapshot env;
  for (const char* name : {kProfileVar, kAccessKeyVar, kSecretKeyVar}) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') {
      env[name] = value;
    }
  }
  return env;
}

bool resolveCredentials(
  const EnvironmentSnapshot& env, AwsCredentialConfig& out, std::string& error_msg
) {
  std::string profile = lookup(env, kProfileVar);
  std::string access_key = lookup(env, kAccessKeyVar);
  std::string secret_key = lookup(env, kSecretKeyVar);

  if (!profile.empty() && (!access_key.empty() || !secret_key.empty())) {
    error_msg =
      "Both `AWS_DEFAULT_PROFILE` provided as well as `AWS_ACCESS_KEY` and / or "
      "`AWS_SECRET_KEY`. Only one authentication method may be used.";
    return false;
  }

  if (!profile.empty()) {
    RUNLIFT_LOG_INFO("Using AWS profile for authentication" << kv("profile", profile));
    out = AwsCredentialConfig{profile, "", ""};
    return true;
  }

  if (!access_key.empty() && !secret_key.empty()) {
    RUNLIFT_LOG_INFO("Using AWS_ACCESS_KEY and AWS_SECRET_KEY for authentication");
    out = AwsCredentialConfig{"", access_key, secret_key};
    return true;
  }

  error_msg =
    "Required environment variables for AWS authentication not defined. Requires either "
    "`AWS_DEFAULT_PROFILE` or `AWS_ACCESS_KEY` and `AWS_SECRET_KEY`.";
  return false;
}

}  // namespace uploader
}  // namespace runlift
