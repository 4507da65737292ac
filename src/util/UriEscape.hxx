// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

/**
 * Percent-encode a string as described in RFC 3986 (only unreserved
 * characters remain).
 *
 * @param keep_slash if true, then '/' is not encoded (for S3 object
 * keys)
 */
std::string
UriEscape(std::string_view src, bool keep_slash=false);
