// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

/**
 * Normalize PEM text: all line endings become LF, trailing
 * whitespace and blank lines are removed and the result ends with
 * exactly one newline.  Base64 line wrapping is not changed.
 */
std::string
CanonicalizePem(std::string_view pem);

/**
 * Compare two PEM public keys.  Both must be RSA or EC public keys;
 * the comparison is byte-exact on the canonicalized PEM text, not on
 * the decoded key material.
 *
 * Throws #KmsCertError with UNSUPPORTED_PUBLIC_KEY_FORMAT if one of
 * them is not an RSA/EC public key.
 */
bool
PublicKeyPemEquals(std::string_view a, std::string_view b);

/**
 * Extract the public key of a PEM certificate and return it as a PEM
 * "PUBLIC KEY" block.
 */
std::string
GetCertificatePublicKeyPem(std::string_view certificate_pem);

/**
 * Convert a DER SubjectPublicKeyInfo (as returned by the signing
 * oracle) to a PEM "PUBLIC KEY" block.
 */
std::string
DerPublicKeyToPem(std::span<const std::byte> der);
