// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * Everything that goes into a self-signed certificate except for
 * the key.  Built once from the command line, immutable thereafter.
 */
struct CertificateRequest {
	/* subject fields; only #common_name is mandatory, empty
	   strings are omitted */
	std::string country, state, locality;
	std::string organization, organizational_unit;
	std::string common_name;
	std::string email;

	/**
	 * DNS names for the "subjectAltName" extension, in this
	 * order.
	 */
	std::vector<std::string> subject_alt_names;

	unsigned validity_days = 9125;

	uint64_t serial = 1;

	bool is_ca = false;

	/**
	 * Check the invariants.  Throws #KmsCertError with
	 * INPUT_VALIDATION on error.
	 */
	void Check() const;
};

/**
 * Format the subject in OpenSSL's "/C=../CN=.." notation (C, ST, L,
 * O, OU, CN, emailAddress).
 */
std::string
FormatSubject(const CertificateRequest &request);

/**
 * Format the value of the "subjectAltName" extension,
 * e.g. "DNS:a.example,DNS:b.example".
 *
 * @return an empty string if there are no names
 */
std::string
FormatSubjectAltName(const std::vector<std::string> &names);
