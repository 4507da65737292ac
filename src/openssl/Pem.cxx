// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Pem.hxx"
#include "MemBio.hxx"
#include "Error.hxx"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

using std::string_view_literals::operator""sv;

std::string
CertificateToPem(const X509 &cert)
{
	return BioWriterToString([&cert](BIO &bio){
		if (!PEM_write_bio_X509(&bio, &cert))
			throw SslError{"PEM_write_bio_X509() failed"};
	});
}

UniqueX509
ParseCertificatePem(std::string_view pem)
{
	const auto bio = MakeReadOnlyMemBio(pem);
	UniqueX509 cert{PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)};
	if (!cert)
		throw SslError{"Failed to parse PEM certificate"};

	return cert;
}

std::string
PublicKeyToPem(const EVP_PKEY &key)
{
	return BioWriterToString([&key](BIO &bio){
		if (!PEM_write_bio_PUBKEY(&bio, &key))
			throw SslError{"PEM_write_bio_PUBKEY() failed"};
	});
}

std::vector<std::byte>
PublicKeyToDer(const EVP_PKEY &key)
{
	unsigned char *data = nullptr;
	const int length = i2d_PUBKEY(&key, &data);
	if (length < 0)
		throw SslError{"i2d_PUBKEY() failed"};

	const auto *p = reinterpret_cast<const std::byte *>(data);
	std::vector<std::byte> result{p, p + length};
	OPENSSL_free(data);
	return result;
}

UniqueEVP_PKEY
ParsePublicKeyPem(std::string_view pem)
{
	const auto bio = MakeReadOnlyMemBio(pem);
	UniqueEVP_PKEY key{PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr)};
	if (!key)
		throw SslError{"Failed to parse PEM public key"};

	return key;
}

UniqueEVP_PKEY
ParsePublicKeyDer(std::span<const std::byte> der)
{
	auto *p = reinterpret_cast<const unsigned char *>(der.data());
	UniqueEVP_PKEY key{d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()))};
	if (!key)
		throw SslError{"Failed to parse DER public key"};

	return key;
}

static bool
LooksLikePem(std::span<const std::byte> src) noexcept
{
	const std::string_view s{reinterpret_cast<const char *>(src.data()), src.size()};
	return s.find("-----BEGIN "sv) != s.npos;
}

UniqueEVP_PKEY
ParseAnyKey(std::span<const std::byte> src)
{
	if (!LooksLikePem(src))
		return ParsePublicKeyDer(src);

	const std::string_view pem{reinterpret_cast<const char *>(src.data()), src.size()};

	if (pem.find("PUBLIC KEY-----"sv) != pem.npos)
		return ParsePublicKeyPem(pem);

	const auto bio = MakeReadOnlyMemBio(pem);
	UniqueEVP_PKEY key{PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr)};
	if (!key)
		throw SslError{"Failed to parse PEM private key"};

	return key;
}
