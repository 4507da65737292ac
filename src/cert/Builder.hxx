// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

struct CertificateRequest;
class SigningKey;
enum class SigningAlgorithm;

/**
 * Build an X.509 v3 certificate whose issuer is its subject, signed
 * by the given key with the digest of the given algorithm.
 *
 * Extensions: a critical "basicConstraints", "subjectAltName" (only
 * if there are names) and "subjectKeyIdentifier".
 *
 * Throws #KmsCertError with SIGNING_FAILED if the key refuses to sign
 * and with CERTIFICATE_GENERATION_FAILED on all other OpenSSL errors
 * (the #SslError is nested).
 *
 * @return the certificate in PEM format
 */
std::string
BuildSelfSignedCertificate(const CertificateRequest &request,
			   SigningAlgorithm algorithm,
			   SigningKey &key);
