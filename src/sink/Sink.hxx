// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Target.hxx"

#include <string>
#include <string_view>

class SinkBackend;

/**
 * Wrap the certificate in a JSON object: {"<field>":"<pem>"}.
 */
std::string
WrapCertificateJson(std::string_view pem, std::string_view field);

/**
 * Write the certificate to exactly one destination.  Secrets and
 * parameters are created if they do not exist and updated
 * otherwise; all other destinations are overwritten (or, for
 * messages, sent once).
 *
 * Throws #KmsCertError with SINK_WRITE_FAILED on error (the cause is
 * nested).
 */
void
WriteCertificate(const SinkTarget &target, std::string_view pem,
		 SinkBackend &backend);
