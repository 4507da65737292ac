// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "openssl/Unique.hxx"

#include <cstddef>
#include <string>
#include <vector>

/**
 * Read a (small) regular file into memory.
 *
 * Throws #KmsCertError with INPUT_FILE if the file is missing, is
 * not a regular file or is too large.
 */
std::vector<std::byte>
LoadInputFile(const char *path);

/**
 * Load a PEM certificate file.
 *
 * Throws #KmsCertError with INPUT_FILE on error.
 */
std::string
LoadCertificateFile(const char *path);

/**
 * Load a key file (PEM private key, PEM public key or DER
 * SubjectPublicKeyInfo).
 *
 * Throws #KmsCertError with INPUT_FILE on error.
 */
UniqueEVP_PKEY
LoadKeyFile(const char *path);
