// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Base64.hxx"

#include <stdexcept>

std::string
SodiumBase64(std::span<const std::byte> src, int variant)
{
	std::string result;
	result.resize(sodium_base64_ENCODED_LEN(src.size(), variant));

	sodium_bin2base64(result.data(), result.size(),
			  reinterpret_cast<const unsigned char *>(src.data()),
			  src.size(), variant);

	/* strip the null terminator which was included in the
	   buffer size */
	result.resize(result.size() - 1);
	return result;
}

std::vector<std::byte>
SodiumDecodeBase64(std::string_view src, int variant)
{
	std::vector<std::byte> result(src.size() * 3 / 4 + 3);

	std::size_t length;
	if (sodium_base642bin(reinterpret_cast<unsigned char *>(result.data()),
			      result.size(),
			      src.data(), src.size(),
			      "\r\n", &length, nullptr, variant) != 0)
		throw std::invalid_argument{"Malformed Base64 string"};

	result.resize(length);
	return result;
}
