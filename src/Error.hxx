// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <stdexcept>

/**
 * The failure classes a kmscert invocation can report.  Each one is
 * fatal for the current invocation; nothing is retried internally.
 */
enum class ErrorCode {
	/**
	 * A required argument is missing or malformed.
	 */
	INPUT_VALIDATION,

	/**
	 * An input file (certificate or key) is missing or cannot be
	 * parsed.
	 */
	INPUT_FILE,

	UNSUPPORTED_KEY_SPEC,
	WRONG_KEY_USAGE,
	INCOMPATIBLE_KEY_FAMILY,

	/**
	 * DescribeKey, GetPublicKey or Sign failed (including
	 * authentication failures and throttling).
	 */
	ORACLE_CALL_FAILED,

	/**
	 * The remote key refused to produce a signature while a
	 * certificate was being signed.
	 */
	SIGNING_FAILED,

	CERTIFICATE_GENERATION_FAILED,
	UNSUPPORTED_PUBLIC_KEY_FORMAT,

	/**
	 * The certificate was produced, but could not be delivered to
	 * its destination.
	 */
	SINK_WRITE_FAILED,
};

class KmsCertError : public std::runtime_error {
	ErrorCode code;

public:
	KmsCertError(ErrorCode _code, const char *_msg)
		:std::runtime_error(_msg), code(_code) {}

	KmsCertError(ErrorCode _code, const std::string &_msg)
		:std::runtime_error(_msg), code(_code) {}

	ErrorCode GetCode() const noexcept {
		return code;
	}
};

/**
 * Find the first #KmsCertError in the (possibly nested) exception
 * chain and return its code.
 *
 * @return the code or std::nullopt if there is no #KmsCertError in
 * the chain
 */
std::optional<ErrorCode>
FindErrorCode(const std::exception &e) noexcept;
