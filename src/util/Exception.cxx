// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Exception.hxx"

#include <stdexcept>

std::string
GetFullMessage(const std::exception &e,
	       const char *fallback, const char *separator) noexcept
try {
	std::string result{e.what()};

	try {
		std::rethrow_if_nested(e);
	} catch (...) {
		const auto nested = GetFullMessage(std::current_exception(),
						   fallback, separator);
		if (!nested.empty()) {
			if (!result.empty())
				result += separator;
			result += nested;
		}
	}

	return result;
} catch (...) {
	return fallback;
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return fallback;
	}
}
