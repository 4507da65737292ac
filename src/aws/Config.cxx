// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"

#include <stdlib.h>

static std::string
GetEnv(const char *name) noexcept
{
	const char *value = getenv(name);
	return value != nullptr ? value : "";
}

AwsConfig
LoadAwsConfigFromEnvironment()
{
	AwsConfig config;

	config.region = GetEnv("AWS_REGION");
	if (config.region.empty())
		config.region = GetEnv("AWS_DEFAULT_REGION");

	config.access_key_id = GetEnv("AWS_ACCESS_KEY_ID");
	config.secret_access_key = GetEnv("AWS_SECRET_ACCESS_KEY");
	config.session_token = GetEnv("AWS_SESSION_TOKEN");
	config.endpoint_url = GetEnv("AWS_ENDPOINT_URL");

	while (!config.endpoint_url.empty() && config.endpoint_url.back() == '/')
		config.endpoint_url.pop_back();

	return config;
}
