// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/ossl_typ.h>

#include <string>

/**
 * Calculate an OpenSSH-style SHA-256 fingerprint of the DER
 * SubjectPublicKeyInfo of the given key, e.g. "SHA256:47DEQpj8...".
 * Used only for log messages.
 */
std::string
GetFingerprint(const EVP_PKEY &key) noexcept;

/**
 * Like GetFingerprint(const EVP_PKEY &), but parse a PEM public key
 * first.
 */
std::string
GetPemFingerprint(std::string_view pem) noexcept;
