// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>
#include <vector>

struct HttpRequest {
	/**
	 * The request method; only "POST" and "PUT" are used.
	 */
	const char *method = "POST";

	std::string url;

	/**
	 * Complete header lines ("Name: value").
	 */
	std::vector<std::string> headers;

	std::string_view body;

	/**
	 * If not empty, libcurl signs the request with AWS Signature
	 * Version 4; the value is passed to CURLOPT_AWS_SIGV4, e.g.
	 * "aws:amz:eu-central-1:kms".
	 */
	std::string aws_sigv4;

	/**
	 * Credentials for #aws_sigv4 (access key id and secret access
	 * key).
	 */
	std::string user, password;

	long timeout_seconds = 60;
};

struct HttpResponse {
	unsigned status;
	std::string body;

	bool IsSuccess() const noexcept {
		return status >= 200 && status < 300;
	}
};

/**
 * Send a HTTP request and wait for the response.  This blocks the
 * calling thread.  Transport failures throw #CurlError; HTTP error
 * statuses are returned to the caller.
 */
HttpResponse
SendHttpRequest(const HttpRequest &request);
