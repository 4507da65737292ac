// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * PEM/DER conversions for certificates and public keys.  All
 * functions throw #SslError on error.
 */

#pragma once

#include "Unique.hxx"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

std::string
CertificateToPem(const X509 &cert);

UniqueX509
ParseCertificatePem(std::string_view pem);

/**
 * Serialize the public half of a key as a PEM "PUBLIC KEY"
 * (SubjectPublicKeyInfo) block.
 */
std::string
PublicKeyToPem(const EVP_PKEY &key);

std::vector<std::byte>
PublicKeyToDer(const EVP_PKEY &key);

UniqueEVP_PKEY
ParsePublicKeyPem(std::string_view pem);

/**
 * Parse a DER-encoded SubjectPublicKeyInfo (the format returned by
 * the KMS "GetPublicKey" call).
 */
UniqueEVP_PKEY
ParsePublicKeyDer(std::span<const std::byte> der);

/**
 * Parse a key file which contains a PEM private key, a PEM public
 * key or a DER SubjectPublicKeyInfo.
 */
UniqueEVP_PKEY
ParseAnyKey(std::span<const std::byte> src);
