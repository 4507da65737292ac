// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"
#include "Error.hxx"

#include <openssl/bio.h>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

/**
 * Call a function which writes into a temporary memory BIO and return
 * everything it wrote as a std::string.
 */
template<typename W>
inline std::string
BioWriterToString(W &&writer)
{
	UniqueBIO bio{BIO_new(BIO_s_mem())};
	if (!bio)
		throw SslError{"BIO_new() failed"};

	writer(*bio);

	char *data;
	const long length = BIO_get_mem_data(bio.get(), &data);
	return {data, static_cast<std::size_t>(length)};
}

/**
 * Create a read-only memory BIO referring to the given buffer (which
 * must remain valid while the BIO is in use).
 */
inline UniqueBIO
MakeReadOnlyMemBio(std::span<const std::byte> src)
{
	UniqueBIO bio{BIO_new_mem_buf(src.data(), static_cast<int>(src.size()))};
	if (!bio)
		throw SslError{"BIO_new_mem_buf() failed"};

	return bio;
}

inline UniqueBIO
MakeReadOnlyMemBio(std::string_view src)
{
	return MakeReadOnlyMemBio(std::as_bytes(std::span{src}));
}
