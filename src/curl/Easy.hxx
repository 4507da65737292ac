// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <curl/curl.h>

#include <stdexcept>
#include <string>
#include <utility>

class CurlError : public std::runtime_error {
	CURLcode code;

public:
	CurlError(CURLcode _code, const std::string &_msg)
		:std::runtime_error(_msg), code(_code) {}

	CURLcode GetCode() const noexcept {
		return code;
	}
};

/**
 * OO wrapper for a CURL easy handle.
 */
class CurlEasy {
	CURL *handle;

public:
	CurlEasy()
		:handle(curl_easy_init())
	{
		if (handle == nullptr)
			throw std::runtime_error{"curl_easy_init() failed"};
	}

	CurlEasy(CurlEasy &&src) noexcept
		:handle(std::exchange(src.handle, nullptr)) {}

	~CurlEasy() noexcept {
		if (handle != nullptr)
			curl_easy_cleanup(handle);
	}

	CurlEasy &operator=(CurlEasy &&src) noexcept {
		std::swap(handle, src.handle);
		return *this;
	}

	CURL *Get() noexcept {
		return handle;
	}

	template<typename T>
	void SetOption(CURLoption option, T value) {
		const CURLcode code = curl_easy_setopt(handle, option, value);
		if (code != CURLE_OK)
			throw CurlError{code, curl_easy_strerror(code)};
	}

	void SetURL(const char *value) {
		SetOption(CURLOPT_URL, value);
	}

	void SetRequestHeaders(struct curl_slist *headers) {
		SetOption(CURLOPT_HTTPHEADER, headers);
	}

	/**
	 * Set the request body.  The buffer is not copied and must
	 * remain valid until Perform() returns.
	 */
	void SetRequestBody(const void *data, std::size_t size) {
		SetOption(CURLOPT_POSTFIELDS, data);
		SetOption(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(size));
	}

	void Perform();

	long GetResponseCode() const noexcept {
		long code = 0;
		curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code);
		return code;
	}
};

/**
 * OO wrapper for a "struct curl_slist *".
 */
class CurlSlist {
	struct curl_slist *head = nullptr;

public:
	CurlSlist() noexcept = default;

	CurlSlist(const CurlSlist &) = delete;
	CurlSlist &operator=(const CurlSlist &) = delete;

	~CurlSlist() noexcept {
		curl_slist_free_all(head);
	}

	struct curl_slist *Get() noexcept {
		return head;
	}

	void Append(const char *value) {
		auto *list = curl_slist_append(head, value);
		if (list == nullptr)
			throw std::runtime_error{"curl_slist_append() failed"};

		head = list;
	}
};
