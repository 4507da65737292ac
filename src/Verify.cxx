// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Verify.hxx"
#include "Error.hxx"
#include "Log.hxx"
#include "key/Fingerprint.hxx"
#include "key/LoadFile.hxx"
#include "key/Match.hxx"
#include "openssl/Pem.hxx"
#include "oracle/Oracle.hxx"

#include <fmt/core.h>

static constexpr Logger logger{"verify"};

static VerifyResult
Compare(std::string_view certificate_key_pem, std::string_view reference_pem,
	std::string_view reference_name)
{
	if (PublicKeyPemEquals(certificate_key_pem, reference_pem)) {
		logger.Fmt(1, "Certificate public key matches {}",
			   reference_name);
		return VerifyResult::MATCH;
	}

	logger.Fmt(0, "Warning: certificate public key ({}) does not match {} ({})",
		   GetPemFingerprint(certificate_key_pem), reference_name,
		   GetPemFingerprint(reference_pem));
	return VerifyResult::MISMATCH;
}

VerifyResult
VerifyCertificateWithKms(SigningOracle &oracle, std::string_view key_id,
			 const char *certificate_path)
{
	const auto certificate = LoadCertificateFile(certificate_path);
	const auto certificate_key = GetCertificatePublicKeyPem(certificate);

	const auto kms_key = DerPublicKeyToPem(oracle.GetPublicKey(key_id));

	return Compare(certificate_key, kms_key,
		       fmt::format("KMS key '{}'", key_id));
}

VerifyResult
VerifyCertificateWithKeyFile(const char *certificate_path,
			     const char *key_path)
{
	const auto certificate = LoadCertificateFile(certificate_path);
	const auto certificate_key = GetCertificatePublicKeyPem(certificate);

	const auto key = LoadKeyFile(key_path);
	const auto file_key = PublicKeyToPem(*key);

	return Compare(certificate_key, file_key,
		       fmt::format("key file '{}'", key_path));
}

int
GetVerifyExitCode(VerifyResult result) noexcept
{
	switch (result) {
	case VerifyResult::MATCH:
		return VERIFY_EXIT_MATCH;

	case VerifyResult::MISMATCH:
		return VERIFY_EXIT_MISMATCH;
	}

	return VERIFY_EXIT_ERROR;
}

int
GetVerifyExitCode(const std::exception &e) noexcept
{
	if (FindErrorCode(e) == ErrorCode::INPUT_FILE)
		return VERIFY_EXIT_INPUT_FILE;

	return VERIFY_EXIT_ERROR;
}
