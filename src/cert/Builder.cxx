// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Builder.hxx"
#include "Request.hxx"
#include "Error.hxx"
#include "Log.hxx"
#include "key/KeySpec.hxx"
#include "openssl/Digest.hxx"
#include "openssl/Error.hxx"
#include "openssl/Pem.hxx"
#include "signer/SigningKey.hxx"

#include <openssl/x509v3.h>

#include <fmt/core.h>

#include <ctime>

static constexpr Logger logger{"cert"};

static void
AddNameEntry(X509_NAME &name, const char *field, const std::string &value)
{
	if (value.empty())
		return;

	if (!X509_NAME_add_entry_by_txt(&name, field, MBSTRING_UTF8,
					reinterpret_cast<const unsigned char *>(value.data()),
					value.size(), -1, 0))
		throw SslError{fmt::format("Bad subject field {}={:?}",
					   field, value)};
}

static UniqueX509_NAME
MakeSubjectName(const CertificateRequest &request)
{
	UniqueX509_NAME name{X509_NAME_new()};
	if (!name)
		throw SslError{"X509_NAME_new() failed"};

	AddNameEntry(*name, "C", request.country);
	AddNameEntry(*name, "ST", request.state);
	AddNameEntry(*name, "L", request.locality);
	AddNameEntry(*name, "O", request.organization);
	AddNameEntry(*name, "OU", request.organizational_unit);
	AddNameEntry(*name, "CN", request.common_name);
	AddNameEntry(*name, "emailAddress", request.email);
	return name;
}

static void
AddExtension(X509 &cert, X509V3_CTX &ctx, int nid, const std::string &value)
{
	const UniqueX509_EXTENSION ext{X509V3_EXT_conf_nid(nullptr, &ctx, nid,
							   value.c_str())};
	if (!ext)
		throw SslError{fmt::format("Bad extension {}={:?}",
					   OBJ_nid2sn(nid), value)};

	if (!X509_add_ext(&cert, ext.get(), -1))
		throw SslError{"X509_add_ext() failed"};
}

static void
SetValidity(X509 &cert, unsigned days)
{
	/* both timestamps are relative to the same instant */
	std::time_t now = std::time(nullptr);

	if (X509_time_adj_ex(X509_getm_notBefore(&cert), 0, 0, &now) == nullptr ||
	    X509_time_adj_ex(X509_getm_notAfter(&cert), days, 0, &now) == nullptr)
		throw SslError{"Failed to set validity"};
}

static void
Sign(X509 &cert, SigningKey &key, SigningAlgorithm algorithm)
try {
	const auto *md = ToEvpMD(GetDigestAlgorithm(algorithm));
	if (md == nullptr)
		throw std::invalid_argument{"Digest algorithm not supported by OpenSSL"};

	if (X509_sign(&cert, &key.GetHandle(), md) <= 0) {
		SslError error{"X509_sign() failed"};

		/* the key's own exception carries more details (and
		   its error code) than the OpenSSL error queue */
		key.RethrowPendingError();

		throw error;
	}
} catch (...) {
	std::throw_with_nested(KmsCertError{ErrorCode::SIGNING_FAILED,
					    fmt::format("Failed to sign certificate with {}",
							ToString(algorithm))});
}

std::string
BuildSelfSignedCertificate(const CertificateRequest &request,
			   SigningAlgorithm algorithm,
			   SigningKey &key)
try {
	request.Check();

	const UniqueX509 cert{X509_new()};
	if (!cert)
		throw SslError{"X509_new() failed"};

	if (!X509_set_version(cert.get(), X509_VERSION_3))
		throw SslError{"X509_set_version() failed"};

	if (!ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert.get()),
				     request.serial))
		throw SslError{"Failed to set serial number"};

	SetValidity(*cert, request.validity_days);

	const auto name = MakeSubjectName(request);
	if (!X509_set_subject_name(cert.get(), name.get()) ||
	    !X509_set_issuer_name(cert.get(), name.get()))
		throw SslError{"Failed to set subject name"};

	if (!X509_set_pubkey(cert.get(), &key.GetHandle()))
		throw SslError{"X509_set_pubkey() failed"};

	X509V3_CTX ctx;
	X509V3_set_ctx_nodb(&ctx);
	X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);

	AddExtension(*cert, ctx, NID_basic_constraints,
		     request.is_ca ? "critical,CA:TRUE" : "critical,CA:FALSE");

	if (const auto san = FormatSubjectAltName(request.subject_alt_names);
	    !san.empty())
		AddExtension(*cert, ctx, NID_subject_alt_name, san);

	AddExtension(*cert, ctx, NID_subject_key_identifier, "hash");

	logger.Fmt(2, "Signing certificate {} serial={} days={} ca={}",
		   FormatSubject(request), request.serial,
		   request.validity_days, request.is_ca);

	Sign(*cert, key, algorithm);

	return CertificateToPem(*cert);
} catch (const KmsCertError &) {
	throw;
} catch (...) {
	std::throw_with_nested(KmsCertError{ErrorCode::CERTIFICATE_GENERATION_FAILED,
					    "Failed to generate certificate"});
}
