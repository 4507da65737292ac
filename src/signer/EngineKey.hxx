// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SigningKey.hxx"
#include "openssl/Unique.hxx"

#include <openssl/engine.h>

#include <memory>
#include <string>

struct KeyDescriptor;

/**
 * Explicit configuration of the OpenSSL ENGINE which exposes the
 * remote key as a PKCS#11 token.  Nothing here is read from or
 * written to the process environment.
 */
struct EngineConfig {
	/**
	 * The OpenSSL ENGINE id; "pkcs11" is libp11.
	 */
	std::string engine_id = "pkcs11";

	/**
	 * The label of the PKCS#11 token which holds the key.  If
	 * empty, then the first token is used.
	 */
	std::string pkcs11_label;

	/**
	 * Path of the PKCS#11 module (e.g. the AWS KMS PKCS#11
	 * provider) passed to the ENGINE as "MODULE_PATH".  If empty,
	 * then the ENGINE's default (or the OpenSSL configuration)
	 * applies.
	 */
	std::string pkcs11_module;

	/**
	 * An OpenSSL configuration file to be loaded before the
	 * ENGINE is looked up.
	 */
	std::string openssl_config;

	/**
	 * Enable verbose output of the ENGINE.
	 */
	bool debug = false;
};

/**
 * Build the RFC 7512 URI of the private key on the given token.
 */
std::string
MakePkcs11KeyUri(std::string_view token_label);

struct EngineDeleter {
	/**
	 * Release the functional reference obtained by ENGINE_init()
	 * and the structural reference obtained by ENGINE_by_id().
	 */
	void operator()(ENGINE *e) const noexcept {
		ENGINE_finish(e);
		ENGINE_free(e);
	}
};

using UniqueENGINE = std::unique_ptr<ENGINE, EngineDeleter>;

/**
 * The engine-handle strategy: the private key is loaded through an
 * OpenSSL ENGINE and every signature is computed by the token
 * behind it.
 */
class EngineSigningKey final : public SigningKey {
	/* declared before #key because the key must be freed before
	   the ENGINE is finished */
	UniqueENGINE engine;

	UniqueEVP_PKEY key;

public:
	/**
	 * Throws #KmsCertError with SIGNING_FAILED if the ENGINE is
	 * not available, the key cannot be loaded or the key does not
	 * match the descriptor.
	 */
	EngineSigningKey(const EngineConfig &config,
			 const KeyDescriptor &descriptor);

	EVP_PKEY &GetHandle() noexcept override {
		return *key;
	}
};
