// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "KeySpec.hxx"
#include "Digest.hxx"
#include "Error.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

KeyDescriptor
KeyDescriptor::Make(std::string_view key_id,
		    std::string_view spec_name,
		    std::string_view usage_name)
{
	return {
		.key_id = std::string{key_id},
		.family = ParseKeyFamily(spec_name),
		.spec = ParseKeySpec(spec_name),
		.usage = ParseKeyUsage(usage_name),
		.spec_name = std::string{spec_name},
	};
}

KeyFamily
ParseKeyFamily(std::string_view spec_name) noexcept
{
	if (spec_name.starts_with("RSA_"sv))
		return KeyFamily::RSA;
	else if (spec_name.starts_with("ECC_"sv))
		return KeyFamily::ECC;
	else
		return KeyFamily::OTHER;
}

KeySpec
ParseKeySpec(std::string_view name) noexcept
{
	if (name == "RSA_2048"sv)
		return KeySpec::RSA_2048;
	else if (name == "RSA_3072"sv)
		return KeySpec::RSA_3072;
	else if (name == "RSA_4096"sv)
		return KeySpec::RSA_4096;
	else if (name == "ECC_NIST_P256"sv)
		return KeySpec::ECC_NIST_P256;
	else if (name == "ECC_NIST_P384"sv)
		return KeySpec::ECC_NIST_P384;
	else if (name == "ECC_NIST_P521"sv)
		return KeySpec::ECC_NIST_P521;
	else
		return KeySpec::OTHER;
}

KeyUsage
ParseKeyUsage(std::string_view name) noexcept
{
	if (name == "SIGN_VERIFY"sv)
		return KeyUsage::SIGN_VERIFY;
	else if (name == "ENCRYPT_DECRYPT"sv)
		return KeyUsage::ENCRYPT_DECRYPT;
	else if (name == "GENERATE_VERIFY_MAC"sv)
		return KeyUsage::GENERATE_VERIFY_MAC;
	else if (name == "KEY_AGREEMENT"sv)
		return KeyUsage::KEY_AGREEMENT;
	else
		return KeyUsage::OTHER;
}

std::string_view
ToString(KeySpec spec) noexcept
{
	switch (spec) {
	case KeySpec::RSA_2048:
		return "RSA_2048"sv;
	case KeySpec::RSA_3072:
		return "RSA_3072"sv;
	case KeySpec::RSA_4096:
		return "RSA_4096"sv;
	case KeySpec::ECC_NIST_P256:
		return "ECC_NIST_P256"sv;
	case KeySpec::ECC_NIST_P384:
		return "ECC_NIST_P384"sv;
	case KeySpec::ECC_NIST_P521:
		return "ECC_NIST_P521"sv;
	case KeySpec::OTHER:
		break;
	}

	return "OTHER"sv;
}

std::string_view
ToString(KeyUsage usage) noexcept
{
	switch (usage) {
	case KeyUsage::SIGN_VERIFY:
		return "SIGN_VERIFY"sv;
	case KeyUsage::ENCRYPT_DECRYPT:
		return "ENCRYPT_DECRYPT"sv;
	case KeyUsage::GENERATE_VERIFY_MAC:
		return "GENERATE_VERIFY_MAC"sv;
	case KeyUsage::KEY_AGREEMENT:
		return "KEY_AGREEMENT"sv;
	case KeyUsage::OTHER:
		break;
	}

	return "OTHER"sv;
}

std::string_view
ToString(SigningAlgorithm algorithm) noexcept
{
	switch (algorithm) {
	case SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256:
		return "RSASSA_PKCS1_V1_5_SHA_256"sv;
	case SigningAlgorithm::ECDSA_SHA_256:
		return "ECDSA_SHA_256"sv;
	case SigningAlgorithm::ECDSA_SHA_384:
		return "ECDSA_SHA_384"sv;
	case SigningAlgorithm::ECDSA_SHA_512:
		return "ECDSA_SHA_512"sv;
	}

	return {};
}

DigestAlgorithm
GetDigestAlgorithm(SigningAlgorithm algorithm) noexcept
{
	switch (algorithm) {
	case SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256:
	case SigningAlgorithm::ECDSA_SHA_256:
		return DigestAlgorithm::SHA256;
	case SigningAlgorithm::ECDSA_SHA_384:
		return DigestAlgorithm::SHA384;
	case SigningAlgorithm::ECDSA_SHA_512:
		return DigestAlgorithm::SHA512;
	}

	return DigestAlgorithm::SHA256;
}

KeyFamily
GetKeyFamily(SigningAlgorithm algorithm) noexcept
{
	return algorithm == SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256
		? KeyFamily::RSA
		: KeyFamily::ECC;
}

static SigningAlgorithm
ResolveKeySpec(const KeyDescriptor &key)
{
	switch (key.spec) {
	case KeySpec::RSA_2048:
	case KeySpec::RSA_3072:
	case KeySpec::RSA_4096:
		return SigningAlgorithm::RSASSA_PKCS1_V1_5_SHA_256;

	case KeySpec::ECC_NIST_P256:
		return SigningAlgorithm::ECDSA_SHA_256;

	case KeySpec::ECC_NIST_P384:
		return SigningAlgorithm::ECDSA_SHA_384;

	case KeySpec::ECC_NIST_P521:
		return SigningAlgorithm::ECDSA_SHA_512;

	case KeySpec::OTHER:
		break;
	}

	throw KmsCertError{ErrorCode::UNSUPPORTED_KEY_SPEC,
			   fmt::format("Unsupported key spec '{}' of key '{}'",
				       key.spec_name, key.key_id)};
}

SigningAlgorithm
ResolveSigningAlgorithm(const KeyDescriptor &key)
{
	const auto algorithm = ResolveKeySpec(key);

	if (key.usage != KeyUsage::SIGN_VERIFY)
		throw KmsCertError{ErrorCode::WRONG_KEY_USAGE,
				   fmt::format("Key '{}' has usage {}, but SIGN_VERIFY is required",
					       key.key_id, ToString(key.usage))};

	return algorithm;
}

void
CheckRsaCompatible(const KeyDescriptor &key)
{
	if (key.family != KeyFamily::RSA)
		throw KmsCertError{ErrorCode::INCOMPATIBLE_KEY_FAMILY,
				   fmt::format("Key '{}' ({}) is not an RSA key",
					       key.key_id, key.spec_name)};
}
