// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>
#include <variant>

/**
 * The JSON field name used by JSON destinations which do not
 * specify one.
 */
inline constexpr std::string_view DEFAULT_JSON_FIELD = "certificate";

struct StdoutTarget {
};

struct FileTarget {
	std::string path;
};

struct HttpPostTarget {
	std::string url;
};

/* for all AWS destinations, an empty region means the default
   region */

struct S3Target {
	std::string region, bucket, key;
};

struct SecretsManagerTarget {
	std::string region, secret_id;
};

struct SnsTarget {
	std::string region, topic_arn;
};

struct SqsTarget {
	std::string region, queue_url;
};

struct SsmTarget {
	std::string region, name;
};

struct DynamoDbTarget {
	std::string region, table;

	std::string hash_key, hash_value;

	/**
	 * Both empty if the table has no sort key.
	 */
	std::string sort_key, sort_value;

	/**
	 * The attribute which receives the certificate.
	 */
	std::string attribute;
};

/**
 * Wraps the certificate in a JSON object with a single field before
 * it is written to the destination.
 */
template<typename T>
struct JsonTarget {
	T destination;

	std::string field{DEFAULT_JSON_FIELD};
};

/**
 * Where to write the certificate to; one alternative per destination
 * kind (see ParseSinkTarget() for the grammar).
 */
using SinkTarget = std::variant<StdoutTarget, JsonTarget<StdoutTarget>,
				FileTarget, JsonTarget<FileTarget>,
				HttpPostTarget, JsonTarget<HttpPostTarget>,
				S3Target, JsonTarget<S3Target>,
				SecretsManagerTarget, JsonTarget<SecretsManagerTarget>,
				SnsTarget, JsonTarget<SnsTarget>,
				SqsTarget, JsonTarget<SqsTarget>,
				SsmTarget, JsonTarget<SsmTarget>,
				DynamoDbTarget, JsonTarget<DynamoDbTarget>>;

/**
 * Parse a destination string such as "file:cert.pem" or
 * "s3:json:eu-central-1|bucket|cert.json|pem".  Fields are separated
 * by '|'; the longest matching prefix wins (e.g. "s3:json:" before
 * "s3:").
 *
 * Throws #KmsCertError with INPUT_VALIDATION on error.
 */
SinkTarget
ParseSinkTarget(std::string_view s);

/**
 * Describe the destination for log messages.
 */
std::string
DescribeSinkTarget(const SinkTarget &target);
