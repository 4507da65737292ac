// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "key/KeySpec.hxx"

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

/**
 * A remote service which holds private keys and exposes only
 * "describe", "get public key" and "sign" operations.  The private
 * key bytes are never available.
 *
 * All methods block for one round trip and throw #KmsCertError with
 * ORACLE_CALL_FAILED on error; they never retry.
 */
class SigningOracle {
public:
	SigningOracle() noexcept = default;
	virtual ~SigningOracle() noexcept = default;

	SigningOracle(const SigningOracle &) = delete;
	SigningOracle &operator=(const SigningOracle &) = delete;

	virtual KeyDescriptor DescribeKey(std::string_view key_id) = 0;

	/**
	 * @return the DER-encoded SubjectPublicKeyInfo
	 */
	virtual std::vector<std::byte> GetPublicKey(std::string_view key_id) = 0;

	/**
	 * Sign a precomputed digest.
	 *
	 * @return the signature (PKCS#1 v1.5 for RSA, a DER-encoded
	 * ECDSA-Sig-Value for ECDSA)
	 */
	virtual std::vector<std::byte> Sign(std::string_view key_id,
					    std::span<const std::byte> digest,
					    SigningAlgorithm algorithm) = 0;
};
