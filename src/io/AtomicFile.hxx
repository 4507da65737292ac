// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/**
 * Replace the contents of a file.  The data is written to a
 * temporary file in the same directory which is then renamed, so
 * readers see either the old or the complete new contents.
 *
 * Throws std::system_error on error.
 */
void
WriteFileAtomic(const char *path, std::string_view data);
