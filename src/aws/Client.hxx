// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <json/value.h>

#include <stdexcept>
#include <string>
#include <string_view>

struct AwsConfig;

/**
 * An error response from an AWS service.
 */
class AwsError : public std::runtime_error {
	unsigned status;

	/**
	 * The error code, e.g. "ResourceNotFoundException" (without
	 * the namespace prefix some services add).
	 */
	std::string type;

public:
	AwsError(unsigned _status, std::string_view _type,
		 const std::string &_msg);

	unsigned GetStatus() const noexcept {
		return status;
	}

	const std::string &GetType() const noexcept {
		return type;
	}

	bool IsType(std::string_view _type) const noexcept {
		return type == _type;
	}
};

/**
 * Convert an error response (awsJson or awsQuery/XML) to an
 * #AwsError.  Bodies which are neither become the message, with an
 * empty type.
 */
AwsError
ParseAwsError(std::string_view service, unsigned status,
	      std::string_view body);

/**
 * A minimal client for the AWS REST APIs, one instance per service
 * and region.  Requests are signed with Signature Version 4 by
 * libcurl.  All calls block until the response has been received;
 * nothing is retried.
 */
class AwsClient {
	const AwsConfig &config;

	const std::string service;
	const std::string region;

public:
	/**
	 * @param _region the region; empty means the default region
	 * from #AwsConfig
	 */
	AwsClient(const AwsConfig &_config, std::string_view _service,
		  std::string_view _region={});

	const std::string &GetRegion() const noexcept {
		return region;
	}

	/**
	 * Invoke an action of a service speaking the "awsJson"
	 * protocol (KMS, Secrets Manager, SSM, SQS, DynamoDB).
	 *
	 * Throws #AwsError on an error response.
	 *
	 * @param json_version "1.0" or "1.1"
	 * @param target the value of the "X-Amz-Target" header,
	 * e.g. "TrentService.DescribeKey"
	 */
	Json::Value CallJson(std::string_view json_version,
			     std::string_view target,
			     const Json::Value &request);

	/**
	 * Invoke an action of a service speaking the "awsQuery"
	 * protocol (SNS).  The response body is returned unparsed.
	 *
	 * @param form a "application/x-www-form-urlencoded" body
	 */
	std::string CallQuery(std::string_view form);

	/**
	 * S3 PutObject.
	 */
	void PutObject(std::string_view bucket, std::string_view key,
		       std::string_view body, std::string_view content_type);

private:
	std::string GetServiceURL() const;

	[[noreturn]]
	void Throw(unsigned status, std::string_view body) const;
};
