// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

enum class DigestAlgorithm;

enum class KeyFamily {
	RSA,
	ECC,
	OTHER,
};

/**
 * A key's family combined with its size or curve, named like the
 * "KeySpec" attribute of AWS KMS.
 */
enum class KeySpec {
	RSA_2048,
	RSA_3072,
	RSA_4096,
	ECC_NIST_P256,
	ECC_NIST_P384,
	ECC_NIST_P521,

	/**
	 * Anything else (symmetric, HMAC, secp256k1, SM2, ...); never
	 * accepted by ResolveSigningAlgorithm().
	 */
	OTHER,
};

enum class KeyUsage {
	SIGN_VERIFY,
	ENCRYPT_DECRYPT,
	GENERATE_VERIFY_MAC,
	KEY_AGREEMENT,
	OTHER,
};

enum class SigningAlgorithm {
	RSASSA_PKCS1_V1_5_SHA_256,
	ECDSA_SHA_256,
	ECDSA_SHA_384,
	ECDSA_SHA_512,
};

/**
 * What the signing oracle reported about a key.  Obtained once per
 * run and never persisted.
 */
struct KeyDescriptor {
	std::string key_id;

	KeyFamily family = KeyFamily::OTHER;
	KeySpec spec = KeySpec::OTHER;
	KeyUsage usage = KeyUsage::OTHER;

	/**
	 * The key spec name as reported by the oracle, for
	 * diagnostics.
	 */
	std::string spec_name;

	/**
	 * Build a descriptor from the oracle's "KeySpec" and
	 * "KeyUsage" strings.
	 */
	static KeyDescriptor Make(std::string_view key_id,
				  std::string_view spec_name,
				  std::string_view usage_name);
};

[[gnu::pure]]
KeyFamily
ParseKeyFamily(std::string_view spec_name) noexcept;

[[gnu::pure]]
KeySpec
ParseKeySpec(std::string_view name) noexcept;

[[gnu::pure]]
KeyUsage
ParseKeyUsage(std::string_view name) noexcept;

[[gnu::const]]
std::string_view
ToString(KeySpec spec) noexcept;

[[gnu::const]]
std::string_view
ToString(KeyUsage usage) noexcept;

/**
 * @return the AWS KMS name of the algorithm,
 * e.g. "RSASSA_PKCS1_V1_5_SHA_256"
 */
[[gnu::const]]
std::string_view
ToString(SigningAlgorithm algorithm) noexcept;

[[gnu::const]]
DigestAlgorithm
GetDigestAlgorithm(SigningAlgorithm algorithm) noexcept;

[[gnu::const]]
KeyFamily
GetKeyFamily(SigningAlgorithm algorithm) noexcept;

/**
 * Map a key descriptor to the one signing algorithm used for
 * self-signed certificates.  This is done before any network or
 * cryptographic call.
 *
 * Throws #KmsCertError with UNSUPPORTED_KEY_SPEC or WRONG_KEY_USAGE.
 */
SigningAlgorithm
ResolveSigningAlgorithm(const KeyDescriptor &key);

/**
 * Pre-flight check for consumers which accept only RSA keys.
 *
 * Throws #KmsCertError with INCOMPATIBLE_KEY_FAMILY.
 */
void
CheckRsaCompatible(const KeyDescriptor &key);
