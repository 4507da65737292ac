// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CatchError.hxx"
#include "aws/Client.hxx"
#include "aws/Config.hxx"
#include "oracle/KmsOracle.hxx"
#include "signer/EngineKey.hxx"
#include "signer/Factory.hxx"
#include "sink/AwsBackend.hxx"
#include "sodium/Base64.hxx"
#include "util/UriEscape.hxx"

#include <gtest/gtest.h>

#include <array>

using std::string_view_literals::operator""sv;

TEST(UriEscape, Basic)
{
	EXPECT_EQ(UriEscape(""), "");
	EXPECT_EQ(UriEscape("abcXYZ019-_.~"), "abcXYZ019-_.~");
	EXPECT_EQ(UriEscape("a b+c=d&e"), "a%20b%2Bc%3Dd%26e");
	EXPECT_EQ(UriEscape("path/to/cert.pem"), "path%2Fto%2Fcert.pem");
	EXPECT_EQ(UriEscape("path/to/cert.pem", true), "path/to/cert.pem");
	EXPECT_EQ(UriEscape("\xc3\xa4"), "%C3%A4");
}

TEST(KmsOracle, KeyRegion)
{
	EXPECT_EQ(GetKmsKeyRegion("arn:aws:kms:eu-central-1:123456789012:key/1234abcd-12ab-34cd-56ef-1234567890ab"),
		  "eu-central-1");
	EXPECT_EQ(GetKmsKeyRegion("arn:aws-us-gov:kms:us-gov-west-1:123456789012:alias/web"),
		  "us-gov-west-1");
	EXPECT_EQ(GetKmsKeyRegion("1234abcd-12ab-34cd-56ef-1234567890ab"), "");
	EXPECT_EQ(GetKmsKeyRegion("alias/web"), "");
	EXPECT_EQ(GetKmsKeyRegion("arn:aws"), "");
}

TEST(EngineKey, Pkcs11Uri)
{
	EXPECT_EQ(MakePkcs11KeyUri(""), "pkcs11:type=private");
	EXPECT_EQ(MakePkcs11KeyUri("kms"), "pkcs11:token=kms;type=private");
	EXPECT_EQ(MakePkcs11KeyUri("my token;1"),
		  "pkcs11:token=my%20token%3B1;type=private");
}

TEST(SignerFactory, ParseSignerType)
{
	EXPECT_EQ(ParseSignerType("engine"), SignerType::ENGINE);
	EXPECT_EQ(ParseSignerType("kms"), SignerType::ORACLE);
	EXPECT_EQ(CatchErrorCode([]{ ParseSignerType("pkcs11"); }),
		  ErrorCode::INPUT_VALIDATION);
	EXPECT_EQ(CatchErrorCode([]{ ParseSignerType(""); }),
		  ErrorCode::INPUT_VALIDATION);
}

TEST(SodiumBase64, Decode)
{
	const auto hello = SodiumDecodeBase64("aGVsbG8=");
	EXPECT_EQ(std::string_view(reinterpret_cast<const char *>(hello.data()),
				   hello.size()),
		  "hello");

	EXPECT_TRUE(SodiumDecodeBase64("").empty());
	EXPECT_THROW(SodiumDecodeBase64("a*b"), std::invalid_argument);
}

TEST(SodiumBase64, Encode)
{
	static constexpr std::array<std::byte, 3> data{
		std::byte{0xfb}, std::byte{0xff}, std::byte{0x00},
	};

	EXPECT_EQ(SodiumBase64(data), "+/8A");
	EXPECT_EQ(SodiumBase64(std::span<const std::byte>{}), "");
}

TEST(AwsClient, Config)
{
	AwsConfig config;
	config.access_key_id = "AKIDEXAMPLE";
	config.secret_access_key = "secret";

	/* no region at all */
	EXPECT_EQ(CatchErrorCode([&]{ AwsClient client{config, "kms"}; }),
		  ErrorCode::INPUT_VALIDATION);

	/* the region of the destination overrides the default */
	config.region = "us-east-1";
	EXPECT_EQ(AwsClient(config, "kms").GetRegion(), "us-east-1");
	EXPECT_EQ(AwsClient(config, "kms", "eu-west-1").GetRegion(), "eu-west-1");

	config.secret_access_key.clear();
	EXPECT_EQ(CatchErrorCode([&]{ AwsClient client{config, "kms"}; }),
		  ErrorCode::INPUT_VALIDATION);
}

TEST(AwsError, Type)
{
	const AwsError error{400, "ResourceNotFoundException", "not found"};
	EXPECT_EQ(error.GetStatus(), 400u);
	EXPECT_TRUE(error.IsType("ResourceNotFoundException"));
	EXPECT_FALSE(error.IsType("ParameterNotFound"));
	EXPECT_STREQ(error.what(), "not found");
}

TEST(AwsError, ParseJson)
{
	const auto secret = ParseAwsError("secretsmanager"sv, 400,
					  R"({"__type":"com.amazonaws.secretsmanager#ResourceNotFoundException","Message":"Secrets Manager can't find the specified secret."})"sv);
	EXPECT_EQ(secret.GetStatus(), 400u);
	EXPECT_EQ(secret.GetType(), "ResourceNotFoundException");
	EXPECT_TRUE(IsSecretNotFound(secret));
	EXPECT_FALSE(IsParameterNotFound(secret));
	EXPECT_NE(std::string_view{secret.what()}.find("can't find the specified secret"sv),
		  std::string_view::npos);

	const auto parameter = ParseAwsError("ssm"sv, 400,
					     R"({"__type":"ParameterNotFound","message":""})"sv);
	EXPECT_EQ(parameter.GetType(), "ParameterNotFound");
	EXPECT_TRUE(IsParameterNotFound(parameter));
	EXPECT_FALSE(IsSecretNotFound(parameter));

	/* other failures must not be mistaken for "does not exist" */
	const auto denied = ParseAwsError("secretsmanager"sv, 400,
					  R"({"__type":"AccessDeniedException","Message":"denied"})"sv);
	EXPECT_EQ(denied.GetType(), "AccessDeniedException");
	EXPECT_FALSE(IsSecretNotFound(denied));
	EXPECT_FALSE(IsParameterNotFound(denied));

	const auto detail = ParseAwsError("kms"sv, 400,
					  R"({"__type":"com.amazonaws.kms#NotFoundException:http://internal"})"sv);
	EXPECT_EQ(detail.GetType(), "NotFoundException");

	/* right type, but not a client error */
	EXPECT_FALSE(IsSecretNotFound(AwsError{500, "ResourceNotFoundException"sv, "x"}));
}

TEST(AwsError, ParseXml)
{
	const auto e = ParseAwsError("sns"sv, 404,
				     "<ErrorResponse><Error><Type>Sender</Type><Code>NotFound</Code><Message>Topic does not exist</Message></Error></ErrorResponse>"sv);
	EXPECT_EQ(e.GetStatus(), 404u);
	EXPECT_EQ(e.GetType(), "NotFound");
	EXPECT_NE(std::string_view{e.what()}.find("Topic does not exist"sv),
		  std::string_view::npos);
}

TEST(AwsError, ParseGarbage)
{
	const auto html = ParseAwsError("secretsmanager"sv, 502,
					"<html>Bad Gateway</html>"sv);
	EXPECT_EQ(html.GetStatus(), 502u);
	EXPECT_TRUE(html.GetType().empty());
	EXPECT_FALSE(IsSecretNotFound(html));
	EXPECT_FALSE(IsParameterNotFound(html));
	EXPECT_NE(std::string_view{html.what()}.find("Bad Gateway"sv),
		  std::string_view::npos);

	const auto broken = ParseAwsError("ssm"sv, 400, "{not json"sv);
	EXPECT_TRUE(broken.GetType().empty());
	EXPECT_FALSE(IsParameterNotFound(broken));
	EXPECT_NE(std::string_view{broken.what()}.find("{not json"sv),
		  std::string_view::npos);
}
