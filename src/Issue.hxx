// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "signer/Factory.hxx"

#include <string>

struct IssueConfig;
class SigningOracle;
class SinkBackend;

/**
 * Issue a self-signed certificate for a KMS key and write it to the
 * configured destination.
 *
 * The destination and the request are validated before the first
 * oracle call.  If the destination cannot be written, the
 * certificate is logged before the error is thrown.
 *
 * Throws #KmsCertError on error.
 *
 * @return the certificate (PEM)
 */
std::string
IssueCertificate(const IssueConfig &config, SigningOracle &oracle,
		 const SigningKeyFactory &key_factory,
		 SinkBackend &backend);
