// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

/**
 * Where and as whom to talk to AWS.
 */
struct AwsConfig {
	/**
	 * The default region; destinations and the KMS key may
	 * override it.
	 */
	std::string region;

	std::string access_key_id;
	std::string secret_access_key;

	/**
	 * Optional session token for temporary credentials.
	 */
	std::string session_token;

	/**
	 * If not empty, all requests go to this base URL instead of
	 * the regional AWS endpoints (e.g. a local emulator).
	 */
	std::string endpoint_url;

	bool HasCredentials() const noexcept {
		return !access_key_id.empty() && !secret_access_key.empty();
	}
};

/**
 * Build an #AwsConfig from the standard AWS environment variables
 * (AWS_REGION, AWS_DEFAULT_REGION, AWS_ACCESS_KEY_ID,
 * AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN, AWS_ENDPOINT_URL).
 */
AwsConfig
LoadAwsConfigFromEnvironment();
