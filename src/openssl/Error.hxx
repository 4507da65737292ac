// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>
#include <string_view>

/**
 * An OpenSSL error.  The constructor drains the OpenSSL error queue
 * of the calling thread and appends its entries to the message.
 */
class SslError : public std::runtime_error {
public:
	explicit SslError(std::string_view msg={});
};
