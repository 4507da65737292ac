// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sodium/utils.h>

/**
 * Encode binary data with Base64 (libsodium's
 * sodium_base64_VARIANT_ORIGINAL unless specified otherwise).
 */
std::string
SodiumBase64(std::span<const std::byte> src,
	     int variant=sodium_base64_VARIANT_ORIGINAL);

/**
 * Decode Base64.  Throws std::invalid_argument on malformed input.
 */
std::vector<std::byte>
SodiumDecodeBase64(std::string_view src,
		   int variant=sodium_base64_VARIANT_ORIGINAL);
