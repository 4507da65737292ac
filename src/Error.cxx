// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <exception>

std::optional<ErrorCode>
FindErrorCode(const std::exception &e) noexcept
{
	if (const auto *k = dynamic_cast<const KmsCertError *>(&e))
		return k->GetCode();

	try {
		std::rethrow_if_nested(e);
	} catch (const std::exception &nested) {
		return FindErrorCode(nested);
	} catch (...) {
		return std::nullopt;
	}

	return std::nullopt;
}
