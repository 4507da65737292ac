// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Match.hxx"
#include "Error.hxx"
#include "openssl/Pem.hxx"
#include "openssl/Error.hxx"

#include <openssl/evp.h>
#include <openssl/x509.h>

using std::string_view_literals::operator""sv;

static constexpr bool
IsTrailingWhitespace(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\r';
}

static constexpr std::string_view
StripRight(std::string_view s) noexcept
{
	while (!s.empty() && IsTrailingWhitespace(s.back()))
		s.remove_suffix(1);
	return s;
}

std::string
CanonicalizePem(std::string_view pem)
{
	std::string result;
	result.reserve(pem.size() + 1);

	while (!pem.empty()) {
		/* a lone CR (old Mac line ending) also terminates a
		   line */
		const auto eol = pem.find_first_of("\r\n"sv);
		std::string_view line = pem.substr(0, eol);

		if (eol == pem.npos) {
			pem = {};
		} else {
			pem.remove_prefix(eol);
			if (pem.starts_with("\r\n"sv))
				pem.remove_prefix(2);
			else
				pem.remove_prefix(1);
		}

		line = StripRight(line);
		if (line.empty())
			continue;

		result.append(line);
		result.push_back('\n');
	}

	return result;
}

static void
CheckSupportedPublicKey(std::string_view pem)
{
	UniqueEVP_PKEY key;

	try {
		key = ParsePublicKeyPem(pem);
	} catch (...) {
		std::throw_with_nested(KmsCertError{ErrorCode::UNSUPPORTED_PUBLIC_KEY_FORMAT,
						    "Not a PEM public key"});
	}

	switch (EVP_PKEY_get_base_id(key.get())) {
	case EVP_PKEY_RSA:
	case EVP_PKEY_EC:
		break;

	default:
		throw KmsCertError{ErrorCode::UNSUPPORTED_PUBLIC_KEY_FORMAT,
				   "Only RSA and EC public keys are supported"};
	}
}

bool
PublicKeyPemEquals(std::string_view a, std::string_view b)
{
	CheckSupportedPublicKey(a);
	CheckSupportedPublicKey(b);

	return CanonicalizePem(a) == CanonicalizePem(b);
}

std::string
GetCertificatePublicKeyPem(std::string_view certificate_pem)
{
	const auto cert = ParseCertificatePem(certificate_pem);

	const EVP_PKEY *key = X509_get0_pubkey(cert.get());
	if (key == nullptr)
		throw SslError{"Certificate has no public key"};

	return PublicKeyToPem(*key);
}

std::string
DerPublicKeyToPem(std::span<const std::byte> der)
{
	return PublicKeyToPem(*ParsePublicKeyDer(der));
}
