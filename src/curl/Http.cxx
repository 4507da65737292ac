// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Http.hxx"
#include "Easy.hxx"

#include <cstring>

void
CurlEasy::Perform()
{
	char error_buffer[CURL_ERROR_SIZE];
	error_buffer[0] = 0;
	SetOption(CURLOPT_ERRORBUFFER, error_buffer);

	const CURLcode code = curl_easy_perform(handle);
	curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, nullptr);

	if (code != CURLE_OK)
		throw CurlError{code,
				*error_buffer != 0
				? std::string{error_buffer}
				: std::string{curl_easy_strerror(code)}};
}

static std::size_t
WriteCallback(char *ptr, std::size_t size, std::size_t nmemb,
	      void *userdata) noexcept
{
	auto &body = *static_cast<std::string *>(userdata);
	const std::size_t nbytes = size * nmemb;

	try {
		body.append(ptr, nbytes);
	} catch (...) {
		/* returning a short count makes libcurl abort the
		   transfer with CURLE_WRITE_ERROR */
		return 0;
	}

	return nbytes;
}

HttpResponse
SendHttpRequest(const HttpRequest &request)
{
	CurlEasy easy;
	easy.SetURL(request.url.c_str());
	easy.SetOption(CURLOPT_NOSIGNAL, 1L);
	easy.SetOption(CURLOPT_TIMEOUT, request.timeout_seconds);
	easy.SetOption(CURLOPT_FOLLOWLOCATION, 0L);

	if (std::strcmp(request.method, "POST") != 0)
		easy.SetOption(CURLOPT_CUSTOMREQUEST, request.method);

	CurlSlist headers;
	for (const auto &i : request.headers)
		headers.Append(i.c_str());

	/* suppress "Expect: 100-continue" */
	headers.Append("Expect:");
	easy.SetRequestHeaders(headers.Get());

	/* never pass nullptr, or libcurl would fall back to
	   reading the body from stdin */
	easy.SetRequestBody(request.body.empty() ? "" : request.body.data(),
			    request.body.size());

	if (!request.aws_sigv4.empty()) {
		easy.SetOption(CURLOPT_AWS_SIGV4, request.aws_sigv4.c_str());
		easy.SetOption(CURLOPT_USERNAME, request.user.c_str());
		easy.SetOption(CURLOPT_PASSWORD, request.password.c_str());
	}

	HttpResponse response;
	easy.SetOption(CURLOPT_WRITEFUNCTION, WriteCallback);
	easy.SetOption(CURLOPT_WRITEDATA, static_cast<void *>(&response.body));

	easy.Perform();

	response.status = static_cast<unsigned>(easy.GetResponseCode());
	return response;
}
