// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "../Digest.hxx"

#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <optional>

[[gnu::const]]
inline const EVP_MD *
ToEvpMD(DigestAlgorithm a) noexcept
{
	switch (a) {
	case DigestAlgorithm::SHA256:
		return EVP_sha256();

	case DigestAlgorithm::SHA384:
		return EVP_sha384();

	case DigestAlgorithm::SHA512:
		return EVP_sha512();
	}

	return nullptr;
}

/**
 * Convert an OpenSSL digest NID (as passed to RSA/ECDSA method
 * callbacks) to a #DigestAlgorithm.
 */
[[gnu::const]]
inline std::optional<DigestAlgorithm>
DigestAlgorithmFromNid(int nid) noexcept
{
	switch (nid) {
	case NID_sha256:
		return DigestAlgorithm::SHA256;

	case NID_sha384:
		return DigestAlgorithm::SHA384;

	case NID_sha512:
		return DigestAlgorithm::SHA512;

	default:
		return std::nullopt;
	}
}
