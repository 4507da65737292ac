// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CatchError.hxx"
#include "Digest.hxx"
#include "key/KeySpec.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static SigningAlgorithm
Resolve(std::string_view spec, std::string_view usage="SIGN_VERIFY"sv)
{
	return ResolveSigningAlgorithm(KeyDescriptor::Make("test-key"sv,
							   spec, usage));
}

TEST(KeySpec, Parse)
{
	const auto key = KeyDescriptor::Make("alias/foo"sv, "ECC_NIST_P384"sv,
					     "SIGN_VERIFY"sv);
	EXPECT_EQ(key.key_id, "alias/foo");
	EXPECT_EQ(key.family, KeyFamily::ECC);
	EXPECT_EQ(key.spec, KeySpec::ECC_NIST_P384);
	EXPECT_EQ(key.usage, KeyUsage::SIGN_VERIFY);
	EXPECT_EQ(key.spec_name, "ECC_NIST_P384");

	EXPECT_EQ(ParseKeyFamily("RSA_2048"sv), KeyFamily::RSA);
	EXPECT_EQ(ParseKeyFamily("ECC_SECG_P256K1"sv), KeyFamily::ECC);
	EXPECT_EQ(ParseKeyFamily("SYMMETRIC_DEFAULT"sv), KeyFamily::OTHER);
	EXPECT_EQ(ParseKeySpec("ECC_SECG_P256K1"sv), KeySpec::OTHER);
	EXPECT_EQ(ParseKeySpec("rsa_2048"sv), KeySpec::OTHER);
	EXPECT_EQ(ParseKeyUsage("ENCRYPT_DECRYPT"sv), KeyUsage::ENCRYPT_DECRYPT);
	EXPECT_EQ(ParseKeyUsage(""sv), KeyUsage::OTHER);
}

TEST(KeySpec, ResolveTable)
{
	EXPECT_EQ(Resolve("RSA_2048"sv), SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256);
	EXPECT_EQ(Resolve("RSA_3072"sv), SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256);
	EXPECT_EQ(Resolve("RSA_4096"sv), SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256);
	EXPECT_EQ(Resolve("ECC_NIST_P256"sv), SigningAlgorithm::ECDSA_SHA_256);
	EXPECT_EQ(Resolve("ECC_NIST_P384"sv), SigningAlgorithm::ECDSA_SHA_384);
	EXPECT_EQ(Resolve("ECC_NIST_P521"sv), SigningAlgorithm::ECDSA_SHA_512);
}

TEST(KeySpec, ResolveUnsupported)
{
	for (const auto spec : {"ECC_SECG_P256K1"sv, "SYMMETRIC_DEFAULT"sv,
				"HMAC_256"sv, "SM2"sv, "RSA_1024"sv, ""sv})
		EXPECT_EQ(CatchErrorCode([spec]{ Resolve(spec); }),
			  ErrorCode::UNSUPPORTED_KEY_SPEC) << spec;
}

TEST(KeySpec, ResolveWrongUsage)
{
	EXPECT_EQ(CatchErrorCode([]{ Resolve("RSA_2048"sv, "ENCRYPT_DECRYPT"sv); }),
		  ErrorCode::WRONG_KEY_USAGE);
	EXPECT_EQ(CatchErrorCode([]{ Resolve("ECC_NIST_P256"sv, "KEY_AGREEMENT"sv); }),
		  ErrorCode::WRONG_KEY_USAGE);

	/* the key spec is checked before the key usage */
	EXPECT_EQ(CatchErrorCode([]{ Resolve("HMAC_256"sv, "GENERATE_VERIFY_MAC"sv); }),
		  ErrorCode::UNSUPPORTED_KEY_SPEC);
}

TEST(KeySpec, RsaCompatible)
{
	EXPECT_NO_THROW(CheckRsaCompatible(KeyDescriptor::Make("k"sv, "RSA_4096"sv,
							       "SIGN_VERIFY"sv)));
	EXPECT_EQ(CatchErrorCode([]{
		CheckRsaCompatible(KeyDescriptor::Make("k"sv, "ECC_NIST_P256"sv,
						       "SIGN_VERIFY"sv));
	}), ErrorCode::INCOMPATIBLE_KEY_FAMILY);
}

TEST(KeySpec, Algorithm)
{
	EXPECT_EQ(ToString(SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256),
		  "RSASSA_PKCS1_V1_5_SHA_256"sv);
	EXPECT_EQ(ToString(SigningAlgorithm::ECDSA_SHA_512), "ECDSA_SHA_512"sv);

	EXPECT_EQ(GetDigestAlgorithm(SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256),
		  DigestAlgorithm::SHA256);
	EXPECT_EQ(GetDigestAlgorithm(SigningAlgorithm::ECDSA_SHA_384),
		  DigestAlgorithm::SHA384);
	EXPECT_EQ(GetDigestAlgorithm(SigningAlgorithm::ECDSA_SHA_512),
		  DigestAlgorithm::SHA512);

	EXPECT_EQ(GetKeyFamily(SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256),
		  KeyFamily::RSA);
	EXPECT_EQ(GetKeyFamily(SigningAlgorithm::ECDSA_SHA_256), KeyFamily::ECC);

	EXPECT_EQ(DigestSize(DigestAlgorithm::SHA384), 48u);
}
