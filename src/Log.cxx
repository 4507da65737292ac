// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Log.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= log_level;
}

void
LogString(std::string_view domain, std::string_view message) noexcept
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", message);
	else
		fmt::print(stderr, "{}: {}\n", domain, message);
}

void
Logger::operator()(unsigned level, std::exception_ptr ep) const noexcept
{
	if (CheckLevel(level))
		LogString(domain, GetFullMessage(ep));
}
