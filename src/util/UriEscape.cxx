// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "UriEscape.hxx"

static constexpr bool
IsUnreserved(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') ||
		ch == '-' || ch == '_' || ch == '.' || ch == '~';
}

static constexpr char
HexDigit(unsigned value) noexcept
{
	return "0123456789ABCDEF"[value & 0xf];
}

std::string
UriEscape(std::string_view src, bool keep_slash)
{
	std::string result;
	result.reserve(src.size());

	for (const char ch : src) {
		if (IsUnreserved(ch) || (keep_slash && ch == '/')) {
			result.push_back(ch);
		} else {
			const auto value = static_cast<unsigned char>(ch);
			result.push_back('%');
			result.push_back(HexDigit(value >> 4));
			result.push_back(HexDigit(value));
		}
	}

	return result;
}
