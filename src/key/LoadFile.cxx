// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LoadFile.hxx"
#include "Error.hxx"
#include "openssl/Pem.hxx"
#include "util/ScopeExit.hxx"

#include <sodium/utils.h>

#include <fmt/core.h>

#include <array>

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

static constexpr std::size_t MAX_INPUT_FILE_SIZE = 1024 * 1024;

[[noreturn]]
static void
ThrowInputFileErrno(const char *msg, const char *path)
{
	const int e = errno;
	throw KmsCertError{ErrorCode::INPUT_FILE,
			   fmt::format("{} '{}': {}", msg, path, strerror(e))};
}

std::vector<std::byte>
LoadInputFile(const char *path)
{
	const int fd = open(path, O_RDONLY|O_NOCTTY|O_CLOEXEC);
	if (fd < 0)
		ThrowInputFileErrno("Failed to open", path);

	AtScopeExit(fd) { close(fd); };

	struct stat st;
	if (fstat(fd, &st) < 0)
		ThrowInputFileErrno("Failed to stat", path);

	if (!S_ISREG(st.st_mode))
		throw KmsCertError{ErrorCode::INPUT_FILE,
				   fmt::format("Not a regular file: '{}'", path)};

	if (st.st_size > static_cast<off_t>(MAX_INPUT_FILE_SIZE))
		throw KmsCertError{ErrorCode::INPUT_FILE,
				   fmt::format("File is too large: '{}'", path)};

	std::vector<std::byte> result(st.st_size);
	std::size_t position = 0;
	while (position < result.size()) {
		const auto nbytes = read(fd, result.data() + position,
					 result.size() - position);
		if (nbytes < 0)
			ThrowInputFileErrno("Failed to read", path);

		if (nbytes == 0)
			break;

		position += nbytes;
	}

	result.resize(position);

	if (result.empty())
		throw KmsCertError{ErrorCode::INPUT_FILE,
				   fmt::format("File is empty: '{}'", path)};

	return result;
}

std::string
LoadCertificateFile(const char *path)
{
	const auto data = LoadInputFile(path);
	const std::string_view pem{reinterpret_cast<const char *>(data.data()), data.size()};

	/* parse once to reject garbage early; the text itself is
	   what the caller works with */
	try {
		ParseCertificatePem(pem);
	} catch (...) {
		std::throw_with_nested(KmsCertError{ErrorCode::INPUT_FILE,
						    fmt::format("Not a PEM certificate: '{}'", path)});
	}

	return std::string{pem};
}

UniqueEVP_PKEY
LoadKeyFile(const char *path)
{
	auto data = LoadInputFile(path);
	AtScopeExit(&data) { sodium_memzero(data.data(), data.size()); };

	try {
		return ParseAnyKey(data);
	} catch (...) {
		std::throw_with_nested(KmsCertError{ErrorCode::INPUT_FILE,
						    fmt::format("Not a supported key file: '{}'", path)});
	}
}
