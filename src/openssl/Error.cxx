// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <openssl/err.h>

#include <string>

static std::string
MakeSslErrorMessage(std::string_view msg)
{
	std::string result{msg};

	const char *data;
	int flags;
	unsigned long code;
	while ((code = ERR_get_error_all(nullptr, nullptr, nullptr,
					 &data, &flags)) != 0) {
		char buffer[256];
		ERR_error_string_n(code, buffer, sizeof(buffer));

		if (!result.empty())
			result += ": ";
		result += buffer;

		if ((flags & ERR_TXT_STRING) != 0 && data != nullptr &&
		    *data != 0) {
			result += " (";
			result += data;
			result.push_back(')');
		}
	}

	if (result.empty())
		result = "Unknown OpenSSL error";

	return result;
}

SslError::SslError(std::string_view msg)
	:std::runtime_error(MakeSslErrorMessage(msg))
{
}
