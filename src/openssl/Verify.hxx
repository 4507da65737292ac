// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Digest.hxx"

#include <openssl/evp.h>

#include <cstddef>
#include <span>

/**
 * Verify a signature over a precomputed digest (PKCS#1 v1.5 for RSA
 * keys, a DER-encoded ECDSA-Sig-Value for EC keys).
 *
 * Throws #SslError if the verification context cannot be set up.
 * A malformed signature is not an error.
 *
 * @return true if the signature is valid
 */
bool
VerifyDigest(EVP_PKEY &key, DigestAlgorithm hash_alg,
	     std::span<const std::byte> digest,
	     std::span<const std::byte> signature);
