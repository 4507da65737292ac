// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Request.hxx"
#include "Error.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

/* keeps notAfter well below the year 9999 */
static constexpr unsigned MAX_VALIDITY_DAYS = 100000;

/**
 * Would this value corrupt the "/" or "," separated text notation?
 */
[[gnu::pure]]
static bool
HasControlCharacters(std::string_view s) noexcept
{
	for (const char ch : s)
		if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f)
			return true;

	return false;
}

static void
CheckField(std::string_view name, std::string_view value)
{
	if (HasControlCharacters(value))
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   fmt::format("Control character in {}", name)};
}

void
CertificateRequest::Check() const
{
	if (common_name.empty())
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   "Common name is missing"};

	if (validity_days == 0)
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   "Validity must be at least one day"};

	if (validity_days > MAX_VALIDITY_DAYS)
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   fmt::format("Validity must not exceed {} days",
					       MAX_VALIDITY_DAYS)};

	if (serial == 0)
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   "Serial number must be at least 1"};

	CheckField("country"sv, country);
	CheckField("state"sv, state);
	CheckField("locality"sv, locality);
	CheckField("organization"sv, organization);
	CheckField("organizational unit"sv, organizational_unit);
	CheckField("common name"sv, common_name);
	CheckField("email address"sv, email);

	for (const auto &i : subject_alt_names) {
		if (i.empty())
			throw KmsCertError{ErrorCode::INPUT_VALIDATION,
					   "Empty subject alternative name"};

		if (i.find(',') != i.npos || HasControlCharacters(i))
			throw KmsCertError{ErrorCode::INPUT_VALIDATION,
					   fmt::format("Malformed subject alternative name {:?}", i)};
	}
}

static void
AppendField(std::string &dest, std::string_view name, std::string_view value)
{
	if (value.empty())
		return;

	dest.push_back('/');
	dest.append(name);
	dest.push_back('=');
	dest.append(value);
}

std::string
FormatSubject(const CertificateRequest &request)
{
	std::string result;
	AppendField(result, "C"sv, request.country);
	AppendField(result, "ST"sv, request.state);
	AppendField(result, "L"sv, request.locality);
	AppendField(result, "O"sv, request.organization);
	AppendField(result, "OU"sv, request.organizational_unit);
	AppendField(result, "CN"sv, request.common_name);
	AppendField(result, "emailAddress"sv, request.email);
	return result;
}

std::string
FormatSubjectAltName(const std::vector<std::string> &names)
{
	std::string result;

	for (const auto &i : names) {
		if (!result.empty())
			result.push_back(',');
		result.append("DNS:"sv);
		result.append(i);
	}

	return result;
}
