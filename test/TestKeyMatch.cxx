// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LocalKey.hxx"
#include "CatchError.hxx"
#include "key/Match.hxx"
#include "openssl/Pem.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static std::string
ReplaceAll(std::string_view s, std::string_view from, std::string_view to)
{
	std::string result;
	while (true) {
		const auto i = s.find(from);
		result.append(s.substr(0, i));
		if (i == s.npos)
			break;
		result.append(to);
		s.remove_prefix(i + from.size());
	}

	return result;
}

TEST(KeyMatch, Canonicalize)
{
	EXPECT_EQ(CanonicalizePem("a\r\nb\r\n"sv), "a\nb\n");
	EXPECT_EQ(CanonicalizePem("a\rb"sv), "a\nb\n");
	EXPECT_EQ(CanonicalizePem("a  \n\n\nb\t\n\n"sv), "a\nb\n");
	EXPECT_EQ(CanonicalizePem("a\nb"sv), "a\nb\n");
	EXPECT_EQ(CanonicalizePem(""sv), "");

	/* idempotent */
	const auto c = CanonicalizePem("x\r\n\r\ny  \r\n"sv);
	EXPECT_EQ(CanonicalizePem(c), c);
}

TEST(KeyMatch, Reflexive)
{
	const UniqueEVP_PKEY keys[] = {GenerateRsaKey(), GenerateEcKey("P-256")};
	for (const auto &key : keys) {
		const auto pem = PublicKeyToPem(*key);
		EXPECT_TRUE(PublicKeyPemEquals(pem, pem));

		/* line endings and trailing newlines don't matter */
		const auto crlf = ReplaceAll(pem, "\n"sv, "\r\n"sv) + "\r\n";
		EXPECT_TRUE(PublicKeyPemEquals(pem, crlf));
		EXPECT_TRUE(PublicKeyPemEquals(crlf, pem));
	}
}

TEST(KeyMatch, Symmetric)
{
	const auto a = PublicKeyToPem(*GenerateEcKey("P-256"));
	const auto b = PublicKeyToPem(*GenerateEcKey("P-256"));
	const auto c = PublicKeyToPem(*GenerateRsaKey());

	EXPECT_FALSE(PublicKeyPemEquals(a, b));
	EXPECT_FALSE(PublicKeyPemEquals(b, a));
	EXPECT_FALSE(PublicKeyPemEquals(a, c));
	EXPECT_FALSE(PublicKeyPemEquals(c, a));
}

TEST(KeyMatch, DerToPem)
{
	const auto key = GenerateRsaKey();
	const auto pem = PublicKeyToPem(*key);
	EXPECT_TRUE(PublicKeyPemEquals(DerPublicKeyToPem(PublicKeyToDer(*key)), pem));
}

TEST(KeyMatch, Unsupported)
{
	const auto rsa = PublicKeyToPem(*GenerateRsaKey());

	UniqueEVP_PKEY ed25519{EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519")};
	ASSERT_TRUE(ed25519);
	const auto ed25519_pem = PublicKeyToPem(*ed25519);

	EXPECT_EQ(CatchErrorCode([&]{ PublicKeyPemEquals(rsa, ed25519_pem); }),
		  ErrorCode::UNSUPPORTED_PUBLIC_KEY_FORMAT);
	EXPECT_EQ(CatchErrorCode([&]{ PublicKeyPemEquals(ed25519_pem, ed25519_pem); }),
		  ErrorCode::UNSUPPORTED_PUBLIC_KEY_FORMAT);
	EXPECT_EQ(CatchErrorCode([&]{ PublicKeyPemEquals(rsa, "not a key"sv); }),
		  ErrorCode::UNSUPPORTED_PUBLIC_KEY_FORMAT);
}
