// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>
#include <utility>
#include <vector>

/**
 * The storage and messaging services a certificate can be written
 * to.  Each method is one blocking round trip; nothing is retried.
 * Errors are reported as exceptions.
 *
 * A @region parameter may be empty, meaning the default region.
 */
class SinkBackend {
public:
	SinkBackend() noexcept = default;
	virtual ~SinkBackend() noexcept = default;

	SinkBackend(const SinkBackend &) = delete;
	SinkBackend &operator=(const SinkBackend &) = delete;

	virtual void WriteStdout(std::string_view data) = 0;

	/**
	 * Replace the file contents.  The file must never be visible
	 * with partial contents.
	 */
	virtual void WriteFile(std::string_view path, std::string_view data) = 0;

	virtual void HttpPost(std::string_view url,
			      std::string_view content_type,
			      std::string_view body) = 0;

	virtual void PutObject(std::string_view region,
			       std::string_view bucket, std::string_view key,
			       std::string_view content_type,
			       std::string_view body) = 0;

	/**
	 * @return false if the service reported that the secret does
	 * not exist; all other errors are thrown
	 */
	virtual bool SecretExists(std::string_view region,
				  std::string_view secret_id) = 0;

	virtual void CreateSecret(std::string_view region,
				  std::string_view name,
				  std::string_view value) = 0;

	virtual void PutSecretValue(std::string_view region,
				    std::string_view secret_id,
				    std::string_view value) = 0;

	/**
	 * @return false if the service reported that the parameter
	 * does not exist; all other errors are thrown
	 */
	virtual bool ParameterExists(std::string_view region,
				     std::string_view name) = 0;

	virtual void PutParameter(std::string_view region,
				  std::string_view name,
				  std::string_view value,
				  bool overwrite) = 0;

	virtual void Publish(std::string_view region,
			     std::string_view topic_arn,
			     std::string_view message) = 0;

	virtual void SendMessage(std::string_view region,
				 std::string_view queue_url,
				 std::string_view body) = 0;

	/**
	 * Create or replace a table item with string attributes.
	 */
	virtual void PutItem(std::string_view region, std::string_view table,
			     const std::vector<std::pair<std::string_view, std::string_view>> &attributes) = 0;
};
