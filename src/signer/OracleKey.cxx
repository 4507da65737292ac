// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "OracleKey.hxx"
#include "Digest.hxx"
#include "Error.hxx"
#include "Log.hxx"
#include "key/DescribeKey.hxx"
#include "oracle/Oracle.hxx"
#include "openssl/Digest.hxx"
#include "openssl/Error.hxx"
#include "openssl/Pem.hxx"
#include "openssl/Verify.hxx"
#include "util/Exception.hxx"

#include <openssl/err.h>

#include <fmt/core.h>

#include <algorithm> // for std::copy()
#include <utility> // for std::exchange()

static constexpr Logger logger{"oracle-key"};

struct OracleKeyDeleter {
	void operator()(RSA *rsa) const noexcept {
		RSA_free(rsa);
	}

	void operator()(EC_KEY *ec) const noexcept {
		EC_KEY_free(ec);
	}
};

using UniqueRSA = std::unique_ptr<RSA, OracleKeyDeleter>;
using UniqueEC_KEY = std::unique_ptr<EC_KEY, OracleKeyDeleter>;

static int
GetRsaExIndex()
{
	static const int index =
		RSA_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
	if (index < 0)
		throw SslError{"RSA_get_ex_new_index() failed"};
	return index;
}

static int
GetEcExIndex()
{
	static const int index =
		EC_KEY_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
	if (index < 0)
		throw SslError{"EC_KEY_get_ex_new_index() failed"};
	return index;
}

OracleSigningKey::OracleSigningKey(SigningOracle &_oracle,
				   const KeyDescriptor &descriptor,
				   SigningAlgorithm _algorithm)
try
	:oracle(_oracle), key_id(descriptor.key_id),
	 algorithm(_algorithm),
	 public_key(ParsePublicKeyDer(oracle.GetPublicKey(key_id)))
{
	CheckKeyMatchesDescriptor(*public_key, descriptor);

	switch (EVP_PKEY_get_base_id(public_key.get())) {
	case EVP_PKEY_RSA:
		handle = MakeRsaHandle();
		break;

	case EVP_PKEY_EC:
		handle = MakeEcHandle();
		break;

	default:
		throw KmsCertError{ErrorCode::SIGNING_FAILED,
				   "Public key is neither RSA nor EC"};
	}
} catch (const KmsCertError &) {
	throw;
} catch (...) {
	std::throw_with_nested(KmsCertError{ErrorCode::SIGNING_FAILED,
					    fmt::format("Failed to open signing key '{}'",
							descriptor.key_id)});
}

UniqueEVP_PKEY
OracleSigningKey::MakeRsaHandle()
{
	const RSA *src = EVP_PKEY_get0_RSA(public_key.get());
	if (src == nullptr)
		throw SslError{"EVP_PKEY_get0_RSA() failed"};

	rsa_method.reset(RSA_meth_dup(RSA_PKCS1_OpenSSL()));
	if (!rsa_method)
		throw SslError{"RSA_meth_dup() failed"};

	if (!RSA_meth_set1_name(rsa_method.get(), "kmscert oracle") ||
	    !RSA_meth_set_sign(rsa_method.get(), RsaSign))
		throw SslError{"Failed to set up RSA_METHOD"};

	UniqueRSA rsa{RSAPublicKey_dup(src)};
	if (!rsa)
		throw SslError{"RSAPublicKey_dup() failed"};

	if (!RSA_set_method(rsa.get(), rsa_method.get()))
		throw SslError{"RSA_set_method() failed"};

	if (!RSA_set_ex_data(rsa.get(), GetRsaExIndex(), this))
		throw SslError{"RSA_set_ex_data() failed"};

	UniqueEVP_PKEY pkey{EVP_PKEY_new()};
	if (!pkey)
		throw SslError{"EVP_PKEY_new() failed"};

	if (!EVP_PKEY_assign_RSA(pkey.get(), rsa.get()))
		throw SslError{"EVP_PKEY_assign_RSA() failed"};

	/* now owned by pkey */
	rsa.release();

	return pkey;
}

UniqueEVP_PKEY
OracleSigningKey::MakeEcHandle()
{
	const EC_KEY *src = EVP_PKEY_get0_EC_KEY(public_key.get());
	if (src == nullptr)
		throw SslError{"EVP_PKEY_get0_EC_KEY() failed"};

	ec_method.reset(EC_KEY_METHOD_new(EC_KEY_OpenSSL()));
	if (!ec_method)
		throw SslError{"EC_KEY_METHOD_new() failed"};

	int (*sign_setup)(EC_KEY *, BN_CTX *, BIGNUM **, BIGNUM **) = nullptr;
	EC_KEY_METHOD_get_sign(ec_method.get(), nullptr, &sign_setup, nullptr);
	EC_KEY_METHOD_set_sign(ec_method.get(), EcSign, sign_setup, EcSignSig);

	UniqueEC_KEY ec{EC_KEY_dup(src)};
	if (!ec)
		throw SslError{"EC_KEY_dup() failed"};

	if (!EC_KEY_set_method(ec.get(), ec_method.get()))
		throw SslError{"EC_KEY_set_method() failed"};

	if (!EC_KEY_set_ex_data(ec.get(), GetEcExIndex(), this))
		throw SslError{"EC_KEY_set_ex_data() failed"};

	UniqueEVP_PKEY pkey{EVP_PKEY_new()};
	if (!pkey)
		throw SslError{"EVP_PKEY_new() failed"};

	if (!EVP_PKEY_assign_EC_KEY(pkey.get(), ec.get()))
		throw SslError{"EVP_PKEY_assign_EC_KEY() failed"};

	ec.release();

	return pkey;
}

void
OracleSigningKey::RethrowPendingError()
{
	if (pending_error)
		std::rethrow_exception(std::exchange(pending_error, nullptr));
}

std::vector<std::byte>
OracleSigningKey::SignDigest(std::optional<DigestAlgorithm> digest_algorithm,
			     std::span<const std::byte> digest)
{
	const auto expected = GetDigestAlgorithm(algorithm);
	if (digest_algorithm && *digest_algorithm != expected)
		throw KmsCertError{ErrorCode::SIGNING_FAILED,
				   fmt::format("Digest {} does not match signing algorithm {}",
					       ToString(*digest_algorithm),
					       ToString(algorithm))};

	if (digest.size() != DigestSize(expected))
		throw KmsCertError{ErrorCode::SIGNING_FAILED,
				   fmt::format("Wrong digest length {} for {}",
					       digest.size(), ToString(expected))};

	logger.Fmt(2, "Signing {} digest with key '{}' ({})",
		   ToString(expected), key_id, ToString(algorithm));

	auto signature = oracle.Sign(key_id, digest, algorithm);

	if (!VerifyDigest(*public_key, expected, digest, signature))
		throw KmsCertError{ErrorCode::SIGNING_FAILED,
				   fmt::format("Signature returned for key '{}' does not verify",
					       key_id)};

	return signature;
}

int
OracleSigningKey::SignCallback(int digest_nid,
			       std::span<const std::byte> digest,
			       unsigned char *sig, unsigned *siglen,
			       std::size_t max_size) noexcept
try {
	pending_error = {};

	std::optional<DigestAlgorithm> digest_algorithm;
	if (digest_nid != NID_undef) {
		digest_algorithm = DigestAlgorithmFromNid(digest_nid);
		if (!digest_algorithm)
			throw KmsCertError{ErrorCode::SIGNING_FAILED,
					   fmt::format("Unsupported digest {}",
						       OBJ_nid2sn(digest_nid))};
	}

	const auto signature = SignDigest(digest_algorithm, digest);
	if (signature.size() > max_size)
		throw KmsCertError{ErrorCode::SIGNING_FAILED,
				   "Signature is too large"};

	std::copy(signature.begin(), signature.end(),
		  reinterpret_cast<std::byte *>(sig));
	*siglen = signature.size();
	return 1;
} catch (...) {
	pending_error = std::current_exception();
	ERR_raise_data(ERR_LIB_USER, ERR_R_OPERATION_FAIL, "%s",
		       GetFullMessage(pending_error).c_str());
	return 0;
}

int
OracleSigningKey::RsaSign(int type, const unsigned char *m,
			  unsigned int m_length,
			  unsigned char *sigret, unsigned int *siglen,
			  const RSA *rsa) noexcept
{
	auto *key = static_cast<OracleSigningKey *>(RSA_get_ex_data(rsa, GetRsaExIndex()));
	if (key == nullptr)
		return 0;

	return key->SignCallback(type,
				 {reinterpret_cast<const std::byte *>(m), m_length},
				 sigret, siglen, RSA_size(rsa));
}

int
OracleSigningKey::EcSign(int type, const unsigned char *dgst, int dlen,
			 unsigned char *sig, unsigned int *siglen,
			 const BIGNUM *, const BIGNUM *,
			 EC_KEY *eckey) noexcept
{
	auto *key = static_cast<OracleSigningKey *>(EC_KEY_get_ex_data(eckey, GetEcExIndex()));
	if (key == nullptr || dlen < 0)
		return 0;

	return key->SignCallback(type,
				 {reinterpret_cast<const std::byte *>(dgst), static_cast<std::size_t>(dlen)},
				 sig, siglen, ECDSA_size(eckey));
}

ECDSA_SIG *
OracleSigningKey::EcSignSig(const unsigned char *dgst, int dgst_len,
			    const BIGNUM *, const BIGNUM *,
			    EC_KEY *eckey) noexcept
{
	auto *key = static_cast<OracleSigningKey *>(EC_KEY_get_ex_data(eckey, GetEcExIndex()));
	if (key == nullptr || dgst_len < 0)
		return nullptr;

	const int max_size = ECDSA_size(eckey);
	if (max_size <= 0)
		return nullptr;

	std::vector<unsigned char> buffer(max_size);
	unsigned length;
	if (!key->SignCallback(NID_undef,
			       {reinterpret_cast<const std::byte *>(dgst), static_cast<std::size_t>(dgst_len)},
			       buffer.data(), &length, buffer.size()))
		return nullptr;

	const unsigned char *p = buffer.data();
	return d2i_ECDSA_SIG(nullptr, &p, length);
}
