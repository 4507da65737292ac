// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "KeySpec.hxx"

#include <openssl/ossl_typ.h>

/**
 * Derive a #KeyDescriptor from a key handle (RSA modulus size or EC
 * group).  The usage of a handle is not known; it is reported as
 * SIGN_VERIFY because only signing keys are exposed as handles.
 *
 * Throws #SslError on error.
 */
KeyDescriptor
DescribeLocalKey(const EVP_PKEY &key, std::string_view key_id);

/**
 * Check whether the key handle matches the descriptor reported by the
 * signing oracle (same family and size/curve).
 *
 * Throws #KmsCertError with SIGNING_FAILED on mismatch.
 */
void
CheckKeyMatchesDescriptor(const EVP_PKEY &key,
			  const KeyDescriptor &expected);
