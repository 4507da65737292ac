// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <curl/curl.h>

#include <stdexcept>

/**
 * Initialize libcurl for the lifetime of this object.  Create one
 * in main() before any other thread exists.
 */
class ScopeCurlInit {
public:
	ScopeCurlInit() {
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
			throw std::runtime_error{"curl_global_init() failed"};
	}

	~ScopeCurlInit() noexcept {
		curl_global_cleanup();
	}

	ScopeCurlInit(const ScopeCurlInit &) = delete;
	ScopeCurlInit &operator=(const ScopeCurlInit &) = delete;
};
