// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Backend.hxx"
#include "aws/Client.hxx"

#include <map>
#include <string>

struct AwsConfig;

/**
 * Does this DescribeSecret error mean the secret does not exist
 * (as opposed to any other failure)?
 */
[[gnu::pure]]
bool
IsSecretNotFound(const AwsError &e) noexcept;

/**
 * Does this GetParameter error mean the parameter does not exist?
 */
[[gnu::pure]]
bool
IsParameterNotFound(const AwsError &e) noexcept;

/**
 * The production #SinkBackend: stdout, local files, plain HTTP POST
 * and the AWS services (S3, Secrets Manager, SNS, SQS, SSM Parameter
 * Store, DynamoDB) through their HTTP APIs.
 */
class AwsSinkBackend final : public SinkBackend {
	const AwsConfig &config;

	/**
	 * Clients by service and region; created on demand.
	 */
	std::map<std::pair<std::string, std::string>, AwsClient> clients;

public:
	explicit AwsSinkBackend(const AwsConfig &_config) noexcept
		:config(_config) {}

	void WriteStdout(std::string_view data) override;
	void WriteFile(std::string_view path, std::string_view data) override;
	void HttpPost(std::string_view url, std::string_view content_type,
		      std::string_view body) override;
	void PutObject(std::string_view region,
		       std::string_view bucket, std::string_view key,
		       std::string_view content_type,
		       std::string_view body) override;
	bool SecretExists(std::string_view region,
			  std::string_view secret_id) override;
	void CreateSecret(std::string_view region, std::string_view name,
			  std::string_view value) override;
	void PutSecretValue(std::string_view region,
			    std::string_view secret_id,
			    std::string_view value) override;
	bool ParameterExists(std::string_view region,
			     std::string_view name) override;
	void PutParameter(std::string_view region, std::string_view name,
			  std::string_view value, bool overwrite) override;
	void Publish(std::string_view region, std::string_view topic_arn,
		     std::string_view message) override;
	void SendMessage(std::string_view region, std::string_view queue_url,
			 std::string_view body) override;
	void PutItem(std::string_view region, std::string_view table,
		     const std::vector<std::pair<std::string_view, std::string_view>> &attributes) override;

private:
	AwsClient &GetClient(std::string_view service,
			     std::string_view region);
};
