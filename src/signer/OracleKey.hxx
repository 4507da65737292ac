// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SigningKey.hxx"
#include "key/KeySpec.hxx"
#include "openssl/Unique.hxx"

#include <openssl/ec.h>
#include <openssl/rsa.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

class SigningOracle;
enum class DigestAlgorithm;

struct OracleMethodDeleter {
	void operator()(RSA_METHOD *m) const noexcept {
		RSA_meth_free(m);
	}

	void operator()(EC_KEY_METHOD *m) const noexcept {
		EC_KEY_METHOD_free(m);
	}
};

/**
 * The digest-sign strategy: an OpenSSL key object which carries the
 * remote public key and an RSA/EC method whose sign operation
 * forwards the digest calculated by OpenSSL to
 * SigningOracle::Sign().  This way, the oracle's signature is the one
 * OpenSSL embeds in the certificate.
 *
 * Each signature returned by the oracle is verified against the
 * remote public key before it is handed to OpenSSL.
 */
class OracleSigningKey final : public SigningKey {
	SigningOracle &oracle;
	const std::string key_id;
	const SigningAlgorithm algorithm;

	/**
	 * The public key returned by SigningOracle::GetPublicKey().
	 */
	UniqueEVP_PKEY public_key;

	/* the methods must outlive #handle */
	std::unique_ptr<RSA_METHOD, OracleMethodDeleter> rsa_method;
	std::unique_ptr<EC_KEY_METHOD, OracleMethodDeleter> ec_method;

	UniqueEVP_PKEY handle;

	/**
	 * The exception thrown by the last failed sign callback.
	 */
	std::exception_ptr pending_error;

public:
	/**
	 * Fetches the public key from the oracle.
	 *
	 * Throws #KmsCertError (ORACLE_CALL_FAILED if the public key
	 * cannot be obtained, SIGNING_FAILED on all other errors).
	 */
	OracleSigningKey(SigningOracle &_oracle,
			 const KeyDescriptor &descriptor,
			 SigningAlgorithm _algorithm);

	EVP_PKEY &GetHandle() noexcept override {
		return *handle;
	}

	void RethrowPendingError() override;

	/**
	 * Ask the oracle to sign a digest and verify the result.
	 *
	 * @param digest_algorithm the algorithm OpenSSL used to
	 * calculate the digest (if known)
	 */
	std::vector<std::byte> SignDigest(std::optional<DigestAlgorithm> digest_algorithm,
					  std::span<const std::byte> digest);

private:
	UniqueEVP_PKEY MakeRsaHandle();
	UniqueEVP_PKEY MakeEcHandle();

	/**
	 * Wrapper for SignDigest() which copies the signature to an
	 * OpenSSL buffer and converts exceptions to OpenSSL errors.
	 *
	 * @return 1 on success, 0 on error
	 */
	int SignCallback(int digest_nid, std::span<const std::byte> digest,
			 unsigned char *sig, unsigned *siglen,
			 std::size_t max_size) noexcept;

	static int RsaSign(int type, const unsigned char *m,
			   unsigned int m_length,
			   unsigned char *sigret, unsigned int *siglen,
			   const RSA *rsa) noexcept;

	static int EcSign(int type, const unsigned char *dgst, int dlen,
			  unsigned char *sig, unsigned int *siglen,
			  const BIGNUM *kinv, const BIGNUM *r,
			  EC_KEY *eckey) noexcept;

	static ECDSA_SIG *EcSignSig(const unsigned char *dgst, int dgst_len,
				    const BIGNUM *in_kinv, const BIGNUM *in_r,
				    EC_KEY *eckey) noexcept;
};
