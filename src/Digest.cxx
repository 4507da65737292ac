// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Digest.hxx"
#include "openssl/Digest.hxx"
#include "openssl/Error.hxx"

using std::string_view_literals::operator""sv;

struct DigestImplementation {
	std::size_t size;
	std::string_view name;
};

static constexpr DigestImplementation digest_implementations[] = {
	{ 32, "SHA-256"sv },
	{ 48, "SHA-384"sv },
	{ 64, "SHA-512"sv },
};

static_assert(DIGEST_MAX_SIZE >= 64);

static constexpr const DigestImplementation &
GetDigestImplementation(DigestAlgorithm a) noexcept
{
	return digest_implementations[static_cast<std::size_t>(a)];
}

std::size_t
DigestSize(DigestAlgorithm a) noexcept
{
	return GetDigestImplementation(a).size;
}

std::string_view
ToString(DigestAlgorithm a) noexcept
{
	return GetDigestImplementation(a).name;
}

std::size_t
Digest(DigestAlgorithm a, std::span<const std::byte> src,
       std::byte *dest)
{
	unsigned size;
	if (!EVP_Digest(src.data(), src.size(),
			reinterpret_cast<unsigned char *>(dest), &size,
			ToEvpMD(a), nullptr))
		throw SslError{"EVP_Digest() failed"};

	return size;
}
