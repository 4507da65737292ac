// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Fingerprint.hxx"
#include "Digest.hxx"
#include "openssl/Pem.hxx"
#include "sodium/Base64.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

std::string
GetFingerprint(const EVP_PKEY &key) noexcept
try {
	const auto der = PublicKeyToDer(key);

	std::byte digest[DIGEST_MAX_SIZE];
	const std::size_t size = Digest(DigestAlgorithm::SHA256, der, digest);

	return fmt::format("SHA256:{}"sv,
			   SodiumBase64(std::span{digest, size},
					sodium_base64_VARIANT_ORIGINAL_NO_PADDING));
} catch (...) {
	return "ERROR";
}

std::string
GetPemFingerprint(std::string_view pem) noexcept
try {
	return GetFingerprint(*ParsePublicKeyPem(pem));
} catch (...) {
	return "ERROR";
}
