// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "EngineKey.hxx"

#include <functional>
#include <memory>
#include <string_view>

class SigningKey;
class SigningOracle;
struct KeyDescriptor;
enum class SigningAlgorithm;

enum class SignerType {
	/**
	 * Load the key through an OpenSSL ENGINE (e.g. a PKCS#11
	 * token backed by the key management service).
	 */
	ENGINE,

	/**
	 * Forward each digest to the signing oracle directly.
	 */
	ORACLE,
};

struct SignerConfig {
	SignerType type = SignerType::ENGINE;

	EngineConfig engine;
};

/**
 * Parse a "--signer" value ("engine" or "kms").
 *
 * Throws #KmsCertError with INPUT_VALIDATION on error.
 */
SignerType
ParseSignerType(std::string_view s);

/**
 * Open the #SigningKey selected by the configuration.
 */
std::unique_ptr<SigningKey>
OpenSigningKey(const SignerConfig &config, SigningOracle &oracle,
	       const KeyDescriptor &key, SigningAlgorithm algorithm);

/**
 * Opens the signing key for a described key; used by
 * IssueCertificate() so tests can substitute local keys.
 */
using SigningKeyFactory =
	std::function<std::unique_ptr<SigningKey>(const KeyDescriptor &key,
						  SigningAlgorithm algorithm)>;
