// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <exception>
#include <string_view>

class SigningOracle;

enum class VerifyResult {
	MATCH,
	MISMATCH,
};

/* exit codes of the verification programs */
static constexpr int VERIFY_EXIT_MATCH = 0;
static constexpr int VERIFY_EXIT_ERROR = 1;
static constexpr int VERIFY_EXIT_MISMATCH = 2;
static constexpr int VERIFY_EXIT_INPUT_FILE = 3;

/**
 * Compare the public key of a certificate file with the public key
 * of a KMS key.  A mismatch is logged as a warning.
 *
 * Throws #KmsCertError on error (INPUT_FILE if the certificate file
 * is missing or invalid).
 */
VerifyResult
VerifyCertificateWithKms(SigningOracle &oracle, std::string_view key_id,
			 const char *certificate_path);

/**
 * Compare the public key of a certificate file with a key file (PEM
 * public key, PEM private key or DER SubjectPublicKeyInfo).
 */
VerifyResult
VerifyCertificateWithKeyFile(const char *certificate_path,
			     const char *key_path);

[[gnu::const]]
int
GetVerifyExitCode(VerifyResult result) noexcept;

/**
 * Determine the exit code for a verification which failed with the
 * given exception.
 */
[[gnu::pure]]
int
GetVerifyExitCode(const std::exception &e) noexcept;
