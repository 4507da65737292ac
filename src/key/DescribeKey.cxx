// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DescribeKey.hxx"
#include "Error.hxx"
#include "openssl/Error.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_GROUP_NAME
#include <openssl/evp.h>

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

static std::string_view
RsaSpecName(int bits) noexcept
{
	switch (bits) {
	case 2048:
		return "RSA_2048"sv;
	case 3072:
		return "RSA_3072"sv;
	case 4096:
		return "RSA_4096"sv;
	default:
		return "RSA_OTHER"sv;
	}
}

static std::string_view
EcSpecName(std::string_view group_name) noexcept
{
	if (group_name == "prime256v1"sv || group_name == "P-256"sv)
		return "ECC_NIST_P256"sv;
	else if (group_name == "secp384r1"sv || group_name == "P-384"sv)
		return "ECC_NIST_P384"sv;
	else if (group_name == "secp521r1"sv || group_name == "P-521"sv)
		return "ECC_NIST_P521"sv;
	else if (group_name == "secp256k1"sv)
		return "ECC_SECG_P256K1"sv;
	else
		return "ECC_OTHER"sv;
}

static std::string
GetGroupName(const EVP_PKEY &key)
{
	/* curve names are short */
	char buffer[80];
	std::size_t length;
	if (!EVP_PKEY_get_utf8_string_param(&key, OSSL_PKEY_PARAM_GROUP_NAME,
					    buffer, sizeof(buffer), &length))
		throw SslError{"Failed to obtain the EC group name"};

	return {buffer, length};
}

KeyDescriptor
DescribeLocalKey(const EVP_PKEY &key, std::string_view key_id)
{
	std::string_view spec_name = "OTHER"sv;

	switch (EVP_PKEY_get_base_id(&key)) {
	case EVP_PKEY_RSA:
		spec_name = RsaSpecName(EVP_PKEY_get_bits(&key));
		break;

	case EVP_PKEY_EC:
		spec_name = EcSpecName(GetGroupName(key));
		break;
	}

	return KeyDescriptor::Make(key_id, spec_name, "SIGN_VERIFY"sv);
}

void
CheckKeyMatchesDescriptor(const EVP_PKEY &key,
			  const KeyDescriptor &expected)
{
	const auto actual = DescribeLocalKey(key, expected.key_id);
	if (actual.family != expected.family || actual.spec != expected.spec)
		throw KmsCertError{ErrorCode::SIGNING_FAILED,
				   fmt::format("Key handle is {}, but key '{}' is {}",
					       actual.spec_name, expected.key_id,
					       expected.spec_name)};
}
