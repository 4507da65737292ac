// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "cert/Request.hxx"
#include "signer/Factory.hxx"

#include <string>

struct IssueConfig {
	/**
	 * The KMS key id, ARN or alias.
	 */
	std::string key_id;

	CertificateRequest request;

	/**
	 * The destination (see ParseSinkTarget()).
	 */
	std::string output = "file:self_signed_certificate.pem";

	SignerConfig signer;

	/**
	 * Reject keys which are not RSA (for consumers which support
	 * only RSA certificates).
	 */
	bool require_rsa = false;

	/**
	 * Throws #KmsCertError with INPUT_VALIDATION on error.
	 */
	void Check() const;
};

struct VerifyKmsConfig {
	std::string key_id;
	std::string certificate_path;

	void Check() const;
};

struct VerifyFileConfig {
	std::string certificate_path;

	/**
	 * A PEM public or private key or a DER SubjectPublicKeyInfo.
	 */
	std::string key_path;

	void Check() const;
};
