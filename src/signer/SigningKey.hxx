// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/ossl_typ.h>

/**
 * A private key handle which can be passed to the OpenSSL X.509 API.
 * The private key material is never held in this process; every
 * signature operation is forwarded to the signing oracle.
 */
class SigningKey {
public:
	SigningKey() noexcept = default;
	virtual ~SigningKey() noexcept = default;

	SigningKey(const SigningKey &) = delete;
	SigningKey &operator=(const SigningKey &) = delete;

	/**
	 * @return an OpenSSL key object which carries the public key
	 * and performs private key operations remotely
	 */
	virtual EVP_PKEY &GetHandle() noexcept = 0;

	/**
	 * If the last OpenSSL signature operation failed inside this
	 * object, rethrow the exception that caused it.  The
	 * OpenSSL error queue carries only a text representation.
	 */
	virtual void RethrowPendingError() {}
};
