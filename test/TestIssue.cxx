// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FakeOracle.hxx"
#include "MemoryBackend.hxx"
#include "CatchError.hxx"
#include "Config.hxx"
#include "Issue.hxx"
#include "json/Util.hxx"
#include "key/Match.hxx"
#include "signer/OracleKey.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

/**
 * A factory which signs with the oracle's local private key, like
 * an ENGINE handle would.
 */
static SigningKeyFactory
MakeLocalFactory(FakeOracle &oracle, unsigned &n_calls)
{
	return [&oracle, &n_calls](const KeyDescriptor &key, SigningAlgorithm) {
		++n_calls;
		return std::make_unique<LocalSigningKey>(oracle.GetKey(key.key_id));
	};
}

static SigningKeyFactory
MakeOracleFactory(FakeOracle &oracle)
{
	return [&oracle](const KeyDescriptor &key, SigningAlgorithm algorithm) {
		return std::make_unique<OracleSigningKey>(oracle, key, algorithm);
	};
}

static IssueConfig
MakeConfig(std::string_view key_id, std::string_view output)
{
	IssueConfig config;
	config.key_id = key_id;
	config.request.common_name = "example.com";
	config.output = output;
	return config;
}

TEST(Issue, StdoutJson)
{
	FakeOracle oracle;
	oracle.Add("alias/web", GenerateRsaKey(), "RSA_2048");

	MemoryBackend backend;
	unsigned n_factory = 0;

	const auto pem = IssueCertificate(MakeConfig("alias/web", "json:myCert"),
					  oracle,
					  MakeLocalFactory(oracle, n_factory),
					  backend);
	EXPECT_EQ(n_factory, 1u);
	EXPECT_EQ(oracle.n_describe, 1u);

	const auto root = ParseJson(backend.stdout_data);
	ASSERT_TRUE(root.isObject());
	EXPECT_EQ(root.getMemberNames(), std::vector<std::string>{"myCert"});

	const auto cert = root["myCert"].asString();
	EXPECT_TRUE(cert.starts_with("-----BEGIN CERTIFICATE-----"sv));
	EXPECT_EQ(cert, pem);

	EXPECT_TRUE(PublicKeyPemEquals(GetCertificatePublicKeyPem(cert),
				       PublicKeyToPem(oracle.GetKey("alias/web"))));
}

TEST(Issue, Oracle)
{
	FakeOracle oracle;
	oracle.Add("ec", GenerateEcKey("P-256"), "ECC_NIST_P256");

	MemoryBackend backend;
	const auto pem = IssueCertificate(MakeConfig("ec", "secretsmanager:|tls"),
					  oracle, MakeOracleFactory(oracle),
					  backend);
	EXPECT_EQ(oracle.n_sign, 1u);
	EXPECT_EQ(backend.secrets["|tls"], pem);

	const auto cert = ParseCertificatePem(pem);
	EXPECT_EQ(X509_verify(cert.get(), &oracle.GetKey("ec")), 1);
}

TEST(Issue, WrongKeyUsage)
{
	FakeOracle oracle;
	oracle.Add("enc", GenerateRsaKey(), "RSA_2048", "ENCRYPT_DECRYPT");

	MemoryBackend backend;
	unsigned n_factory = 0;

	EXPECT_EQ(CatchErrorCode([&]{
		IssueCertificate(MakeConfig("enc", "-"), oracle,
				 MakeLocalFactory(oracle, n_factory), backend);
	}), ErrorCode::WRONG_KEY_USAGE);

	EXPECT_EQ(n_factory, 0u);
	EXPECT_EQ(oracle.n_sign, 0u);
	EXPECT_TRUE(backend.stdout_data.empty());
}

TEST(Issue, UnsupportedKeySpec)
{
	FakeOracle oracle;
	oracle.Add("k1", GenerateEcKey("secp256k1"), "ECC_SECG_P256K1");

	MemoryBackend backend;
	unsigned n_factory = 0;

	EXPECT_EQ(CatchErrorCode([&]{
		IssueCertificate(MakeConfig("k1", "-"), oracle,
				 MakeLocalFactory(oracle, n_factory), backend);
	}), ErrorCode::UNSUPPORTED_KEY_SPEC);

	EXPECT_EQ(n_factory, 0u);
}

TEST(Issue, InvalidOutput)
{
	FakeOracle oracle;
	oracle.Add("rsa", GenerateRsaKey(), "RSA_2048");

	MemoryBackend backend;
	unsigned n_factory = 0;

	EXPECT_EQ(CatchErrorCode([&]{
		IssueCertificate(MakeConfig("rsa", "s3:eu-central-1|bucket"),
				 oracle, MakeLocalFactory(oracle, n_factory),
				 backend);
	}), ErrorCode::INPUT_VALIDATION);

	/* rejected before the first oracle call */
	EXPECT_EQ(oracle.n_describe, 0u);
	EXPECT_EQ(n_factory, 0u);
}

TEST(Issue, InvalidRequest)
{
	FakeOracle oracle;
	oracle.Add("rsa", GenerateRsaKey(), "RSA_2048");

	MemoryBackend backend;
	unsigned n_factory = 0;

	auto config = MakeConfig("rsa", "-");
	config.request.validity_days = 0;

	EXPECT_EQ(CatchErrorCode([&]{
		IssueCertificate(config, oracle,
				 MakeLocalFactory(oracle, n_factory), backend);
	}), ErrorCode::INPUT_VALIDATION);

	EXPECT_EQ(oracle.n_describe, 0u);
}

TEST(Issue, RequireRsa)
{
	FakeOracle oracle;
	oracle.Add("rsa", GenerateRsaKey(), "RSA_2048");
	oracle.Add("ec", GenerateEcKey("P-384"), "ECC_NIST_P384");

	MemoryBackend backend;
	unsigned n_factory = 0;

	auto config = MakeConfig("ec", "-");
	config.require_rsa = true;

	EXPECT_EQ(CatchErrorCode([&]{
		IssueCertificate(config, oracle,
				 MakeLocalFactory(oracle, n_factory), backend);
	}), ErrorCode::INCOMPATIBLE_KEY_FAMILY);
	EXPECT_EQ(n_factory, 0u);

	config.key_id = "rsa";
	IssueCertificate(config, oracle, MakeLocalFactory(oracle, n_factory),
			 backend);
	EXPECT_EQ(n_factory, 1u);
	EXPECT_FALSE(backend.stdout_data.empty());
}

TEST(Issue, OracleFailure)
{
	FakeOracle oracle;

	MemoryBackend backend;
	unsigned n_factory = 0;

	EXPECT_EQ(CatchErrorCode([&]{
		IssueCertificate(MakeConfig("missing", "-"), oracle,
				 MakeLocalFactory(oracle, n_factory), backend);
	}), ErrorCode::ORACLE_CALL_FAILED);
}

TEST(Issue, SigningFailure)
{
	FakeOracle oracle;
	oracle.Add("rsa", GenerateRsaKey(), "RSA_2048");
	oracle.fail_sign = true;

	MemoryBackend backend;

	EXPECT_EQ(CatchErrorCode([&]{
		IssueCertificate(MakeConfig("rsa", "-"), oracle,
				 MakeOracleFactory(oracle), backend);
	}), ErrorCode::SIGNING_FAILED);
	EXPECT_TRUE(backend.stdout_data.empty());
}

TEST(Issue, WrongHandle)
{
	FakeOracle oracle;
	oracle.Add("alias/web", GenerateRsaKey(), "RSA_2048");

	/* an ENGINE handle for some other RSA key */
	const auto other = GenerateRsaKey();

	MemoryBackend backend;
	unsigned n_factory = 0;

	const SigningKeyFactory factory = [&](const KeyDescriptor &, SigningAlgorithm) {
		++n_factory;
		return std::make_unique<LocalSigningKey>(*other);
	};

	EXPECT_EQ(CatchErrorCode([&]{
		IssueCertificate(MakeConfig("alias/web", "file:cert.pem"),
				 oracle, factory, backend);
	}), ErrorCode::SIGNING_FAILED);

	EXPECT_EQ(n_factory, 1u);
	EXPECT_TRUE(backend.files.empty());
	EXPECT_TRUE(backend.stdout_data.empty());
}

TEST(Issue, SinkFailure)
{
	FakeOracle oracle;
	oracle.Add("rsa", GenerateRsaKey(), "RSA_2048");

	MemoryBackend backend;
	backend.fail_write = true;
	unsigned n_factory = 0;

	EXPECT_EQ(CatchErrorCode([&]{
		IssueCertificate(MakeConfig("rsa", "file:cert.pem"), oracle,
				 MakeLocalFactory(oracle, n_factory), backend);
	}), ErrorCode::SINK_WRITE_FAILED);
	EXPECT_EQ(n_factory, 1u);
	EXPECT_TRUE(backend.files.empty());
}
