// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AtomicFile.hxx"
#include "util/ScopeExit.hxx"

#include <fmt/core.h>

#include <string>
#include <system_error>

#include <errno.h>
#include <stdio.h> // for rename()
#include <fcntl.h>
#include <unistd.h>

[[noreturn]]
static void
ThrowErrno(const std::string &msg)
{
	throw std::system_error{errno, std::system_category(), msg};
}

static void
WriteFully(int fd, std::string_view data, const std::string &path)
{
	while (!data.empty()) {
		const auto nbytes = write(fd, data.data(), data.size());
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;
			ThrowErrno(fmt::format("Failed to write {:?}", path));
		}

		data.remove_prefix(nbytes);
	}
}

void
WriteFileAtomic(const char *path, std::string_view data)
{
	const auto tmp_path = fmt::format("{}.tmp{}", path, getpid());

	const int fd = open(tmp_path.c_str(),
			    O_WRONLY|O_CREAT|O_EXCL|O_NOCTTY|O_CLOEXEC, 0644);
	if (fd < 0)
		ThrowErrno(fmt::format("Failed to create {:?}", tmp_path));

	bool committed = false;
	AtScopeExit(&committed, &tmp_path) {
		if (!committed)
			unlink(tmp_path.c_str());
	};

	try {
		WriteFully(fd, data, tmp_path);

		if (fsync(fd) < 0)
			ThrowErrno(fmt::format("Failed to sync {:?}", tmp_path));
	} catch (...) {
		close(fd);
		throw;
	}

	if (close(fd) < 0)
		ThrowErrno(fmt::format("Failed to write {:?}", tmp_path));

	if (rename(tmp_path.c_str(), path) < 0)
		ThrowErrno(fmt::format("Failed to rename {:?} to '{}'",
				       tmp_path, path));

	committed = true;
}
