// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * std::unique_ptr aliases for OpenSSL objects.
 */

#pragma once

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include <memory>

struct OpenSslDeleter {
	void operator()(BIO *bio) const noexcept {
		BIO_free(bio);
	}

	void operator()(BIGNUM *bn) const noexcept {
		BN_free(bn);
	}

	void operator()(EVP_PKEY *key) const noexcept {
		EVP_PKEY_free(key);
	}

	void operator()(EVP_PKEY_CTX *ctx) const noexcept {
		EVP_PKEY_CTX_free(ctx);
	}

	void operator()(EVP_MD_CTX *ctx) const noexcept {
		EVP_MD_CTX_free(ctx);
	}

	void operator()(X509 *cert) const noexcept {
		X509_free(cert);
	}

	void operator()(X509_NAME *name) const noexcept {
		X509_NAME_free(name);
	}

	void operator()(X509_EXTENSION *ext) const noexcept {
		X509_EXTENSION_free(ext);
	}

	void operator()(ECDSA_SIG *sig) const noexcept {
		ECDSA_SIG_free(sig);
	}
};

using UniqueBIO = std::unique_ptr<BIO, OpenSslDeleter>;
using UniqueBIGNUM = std::unique_ptr<BIGNUM, OpenSslDeleter>;
using UniqueEVP_PKEY = std::unique_ptr<EVP_PKEY, OpenSslDeleter>;
using UniqueEVP_PKEY_CTX = std::unique_ptr<EVP_PKEY_CTX, OpenSslDeleter>;
using UniqueEVP_MD_CTX = std::unique_ptr<EVP_MD_CTX, OpenSslDeleter>;
using UniqueX509 = std::unique_ptr<X509, OpenSslDeleter>;
using UniqueX509_NAME = std::unique_ptr<X509_NAME, OpenSslDeleter>;
using UniqueX509_EXTENSION = std::unique_ptr<X509_EXTENSION, OpenSslDeleter>;
using UniqueECDSA_SIG = std::unique_ptr<ECDSA_SIG, OpenSslDeleter>;
