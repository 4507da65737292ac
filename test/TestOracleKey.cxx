// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeOracle.hxx"
#include "CatchError.hxx"
#include "Digest.hxx"
#include "cert/Builder.hxx"
#include "cert/Request.hxx"
#include "openssl/Verify.hxx"
#include "signer/OracleKey.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <array>

static std::string
BuildWithOracle(FakeOracle &oracle, std::string_view key_id)
{
	const auto descriptor = oracle.DescribeKey(key_id);
	const auto algorithm = ResolveSigningAlgorithm(descriptor);

	OracleSigningKey key{oracle, descriptor, algorithm};

	CertificateRequest request;
	request.common_name = "oracle.example";
	return BuildSelfSignedCertificate(request, algorithm, key);
}

static void
CheckSignedBy(const std::string &pem, EVP_PKEY &key)
{
	const auto cert = ParseCertificatePem(pem);
	EXPECT_EQ(X509_verify(cert.get(), &key), 1);
}

TEST(OracleSigningKey, Rsa)
{
	FakeOracle oracle;
	auto &key = oracle.Add("rsa", GenerateRsaKey(), "RSA_2048");

	const auto pem = BuildWithOracle(oracle, "rsa");
	EXPECT_EQ(oracle.n_get_public_key, 1u);
	EXPECT_EQ(oracle.n_sign, 1u);
	CheckSignedBy(pem, key);

	const auto cert = ParseCertificatePem(pem);
	EXPECT_EQ(X509_get_signature_nid(cert.get()), NID_sha256WithRSAEncryption);
}

TEST(OracleSigningKey, P256)
{
	FakeOracle oracle;
	auto &key = oracle.Add("p256", GenerateEcKey("P-256"), "ECC_NIST_P256");

	const auto pem = BuildWithOracle(oracle, "p256");
	EXPECT_EQ(oracle.n_sign, 1u);
	CheckSignedBy(pem, key);

	const auto cert = ParseCertificatePem(pem);
	EXPECT_EQ(X509_get_signature_nid(cert.get()), NID_ecdsa_with_SHA256);
}

TEST(OracleSigningKey, P384)
{
	FakeOracle oracle;
	auto &key = oracle.Add("p384", GenerateEcKey("P-384"), "ECC_NIST_P384");

	const auto pem = BuildWithOracle(oracle, "p384");
	EXPECT_EQ(oracle.n_sign, 1u);
	CheckSignedBy(pem, key);

	const auto cert = ParseCertificatePem(pem);
	EXPECT_EQ(X509_get_signature_nid(cert.get()), NID_ecdsa_with_SHA384);
}

TEST(OracleSigningKey, OracleFailure)
{
	FakeOracle oracle;
	oracle.Add("rsa", GenerateRsaKey(), "RSA_2048");
	oracle.fail_sign = true;

	try {
		BuildWithOracle(oracle, "rsa");
		FAIL();
	} catch (const std::exception &e) {
		EXPECT_EQ(FindErrorCode(e), ErrorCode::SIGNING_FAILED);

		/* the oracle's own message is preserved */
		EXPECT_NE(GetFullMessage(e).find("ThrottlingException"),
			  std::string::npos);
	}

	EXPECT_EQ(oracle.n_sign, 1u);
}

TEST(OracleSigningKey, CorruptRsaSignature)
{
	FakeOracle oracle;
	oracle.Add("rsa", GenerateRsaKey(), "RSA_2048");
	oracle.corrupt_signature = true;

	EXPECT_EQ(CatchErrorCode([&]{ BuildWithOracle(oracle, "rsa"); }),
		  ErrorCode::SIGNING_FAILED);
}

TEST(OracleSigningKey, CorruptEcSignature)
{
	FakeOracle oracle;
	oracle.Add("ec", GenerateEcKey("P-256"), "ECC_NIST_P256");
	oracle.corrupt_signature = true;

	EXPECT_EQ(CatchErrorCode([&]{ BuildWithOracle(oracle, "ec"); }),
		  ErrorCode::SIGNING_FAILED);
}

TEST(OracleSigningKey, SpecMismatch)
{
	FakeOracle oracle;
	oracle.Add("liar", GenerateEcKey("P-256"), "ECC_NIST_P384");

	EXPECT_EQ(CatchErrorCode([&]{ BuildWithOracle(oracle, "liar"); }),
		  ErrorCode::SIGNING_FAILED);
	EXPECT_EQ(oracle.n_sign, 0u);
}

TEST(OracleSigningKey, UnknownKey)
{
	FakeOracle oracle;

	const auto descriptor = KeyDescriptor::Make("missing", "RSA_2048",
						    "SIGN_VERIFY");
	EXPECT_EQ(CatchErrorCode([&]{
		OracleSigningKey key{oracle, descriptor,
				     SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256};
	}), ErrorCode::ORACLE_CALL_FAILED);
}

TEST(OracleSigningKey, SignDigest)
{
	FakeOracle oracle;
	auto &local = oracle.Add("ec", GenerateEcKey("P-384"), "ECC_NIST_P384");

	const auto descriptor = oracle.DescribeKey("ec");
	OracleSigningKey key{oracle, descriptor, SigningAlgorithm::ECDSA_SHA_384};

	std::array<std::byte, DIGEST_MAX_SIZE> digest;
	const std::string_view data = "hello";
	const std::size_t length =
		Digest(DigestAlgorithm::SHA384,
		       std::as_bytes(std::span{data.data(), data.size()}),
		       digest.data());
	const std::span<const std::byte> digest_span{digest.data(), length};

	const auto signature = key.SignDigest(DigestAlgorithm::SHA384,
					      digest_span);
	EXPECT_TRUE(VerifyDigest(local, DigestAlgorithm::SHA384,
				 digest_span, signature));

	/* the digest must match the algorithm */
	EXPECT_EQ(CatchErrorCode([&]{
		key.SignDigest(DigestAlgorithm::SHA256, digest_span);
	}), ErrorCode::SIGNING_FAILED);

	EXPECT_EQ(CatchErrorCode([&]{
		key.SignDigest(std::nullopt, digest_span.first(32));
	}), ErrorCode::SIGNING_FAILED);

	EXPECT_EQ(oracle.n_sign, 1u);
}
