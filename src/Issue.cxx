// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Issue.hxx"
#include "Config.hxx"
#include "Error.hxx"
#include "Log.hxx"
#include "cert/Builder.hxx"
#include "key/Fingerprint.hxx"
#include "key/KeySpec.hxx"
#include "openssl/Pem.hxx"
#include "oracle/Oracle.hxx"
#include "signer/SigningKey.hxx"
#include "sink/Sink.hxx"
#include "sink/Target.hxx"

#include <fmt/core.h>

#include <openssl/evp.h>

static constexpr Logger logger{"issue"};

/**
 * Make sure the signing key handle belongs to the described key;
 * an ENGINE may well hand out a different key than the one the
 * certificate is requested for.
 *
 * Throws #KmsCertError with SIGNING_FAILED on mismatch.
 */
static void
CheckSigningKeyHandle(SigningOracle &oracle, const KeyDescriptor &descriptor,
		      SigningKey &key)
{
	const auto expected =
		ParsePublicKeyDer(oracle.GetPublicKey(descriptor.key_id));

	/* compares the public components only, so an ENGINE handle
	   matches its KMS public key */
	if (EVP_PKEY_eq(expected.get(), &key.GetHandle()) != 1)
		throw KmsCertError{ErrorCode::SIGNING_FAILED,
			fmt::format("Signing key {} does not belong to key '{}'",
				    GetFingerprint(key.GetHandle()),
				    descriptor.key_id)};
}

std::string
IssueCertificate(const IssueConfig &config, SigningOracle &oracle,
		 const SigningKeyFactory &key_factory,
		 SinkBackend &backend)
{
	const auto target = ParseSinkTarget(config.output);
	config.Check();

	const auto descriptor = oracle.DescribeKey(config.key_id);
	if (config.require_rsa)
		CheckRsaCompatible(descriptor);

	const auto algorithm = ResolveSigningAlgorithm(descriptor);
	logger.Fmt(2, "Key '{}' is {}, signing with {}",
		   descriptor.key_id, descriptor.spec_name,
		   ToString(algorithm));

	std::string pem;

	{
		/* the signing key is released as soon as the
		   certificate is built */
		const auto key = key_factory(descriptor, algorithm);
		CheckSigningKeyHandle(oracle, descriptor, *key);
		pem = BuildSelfSignedCertificate(config.request, algorithm,
						 *key);
		logger.Fmt(1, "Issued certificate for key '{}' ({})",
			   descriptor.key_id, GetFingerprint(key->GetHandle()));
	}

	try {
		WriteCertificate(target, pem, backend);
	} catch (...) {
		/* don't lose the work of the signing oracle */
		logger.Fmt(0, "Certificate could not be written:\n{}", pem);
		throw;
	}

	logger.Fmt(1, "Certificate written to {}", DescribeSinkTarget(target));
	return pem;
}
