// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <exception>
#include <string_view>
#include <utility>

/**
 * Set the global log level.  0 prints only errors, 1 (the default)
 * adds warnings and progress, 2 and above add debug output.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
bool
CheckLogLevel(unsigned level) noexcept;

void
LogString(std::string_view domain, std::string_view message) noexcept;

/**
 * A lightweight handle which prefixes all messages with a domain
 * name and filters them by the global log level.  All output goes to
 * stderr, because stdout may be the certificate sink.
 */
class Logger {
	std::string_view domain;

public:
	explicit constexpr Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	bool CheckLevel(unsigned level) const noexcept {
		return CheckLogLevel(level);
	}

	void operator()(unsigned level, std::string_view message) const noexcept {
		if (CheckLevel(level))
			LogString(domain, message);
	}

	void operator()(unsigned level, std::exception_ptr ep) const noexcept;

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const {
		if (!CheckLevel(level))
			return;

		LogString(domain,
			  fmt::format(format_str, std::forward<Args>(args)...));
	}
};
