// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "KmsOracle.hxx"
#include "Error.hxx"
#include "Log.hxx"
#include "sodium/Base64.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

static constexpr Logger logger{"kms"};

static constexpr std::string_view KMS_JSON_VERSION = "1.1"sv;

KmsOracle::KmsOracle(const AwsConfig &config, std::string_view region)
	:client(config, "kms"sv, region)
{
}

[[noreturn]]
static void
ThrowOracleError(std::string_view action, std::string_view key_id)
{
	std::throw_with_nested(KmsCertError{ErrorCode::ORACLE_CALL_FAILED,
					    fmt::format("KMS {} for key '{}' failed",
							action, key_id)});
}

static Json::Value
MakeKeyRequest(std::string_view key_id)
{
	Json::Value request{Json::objectValue};
	request["KeyId"] = std::string{key_id};
	return request;
}

KeyDescriptor
KmsOracle::DescribeKey(std::string_view key_id)
try {
	const auto response = client.CallJson(KMS_JSON_VERSION,
					      "TrentService.DescribeKey"sv,
					      MakeKeyRequest(key_id));
	const auto &metadata = response["KeyMetadata"];
	if (!metadata.isObject())
		throw std::runtime_error{"No KeyMetadata in response"};

	if (const auto state = metadata["KeyState"].asString();
	    !state.empty() && state != "Enabled"sv)
		throw std::runtime_error{fmt::format("Key state is {}", state)};

	/* "CustomerMasterKeySpec" is the deprecated name of
	   "KeySpec" */
	auto spec = metadata["KeySpec"].asString();
	if (spec.empty())
		spec = metadata["CustomerMasterKeySpec"].asString();

	const auto usage = metadata["KeyUsage"].asString();

	logger.Fmt(2, "Key '{}' is {} ({})", key_id, spec, usage);

	return KeyDescriptor::Make(key_id, spec, usage);
} catch (...) {
	ThrowOracleError("DescribeKey"sv, key_id);
}

std::vector<std::byte>
KmsOracle::GetPublicKey(std::string_view key_id)
try {
	const auto response = client.CallJson(KMS_JSON_VERSION,
					      "TrentService.GetPublicKey"sv,
					      MakeKeyRequest(key_id));

	auto der = SodiumDecodeBase64(response["PublicKey"].asString());
	if (der.empty())
		throw std::runtime_error{"No PublicKey in response"};

	return der;
} catch (...) {
	ThrowOracleError("GetPublicKey"sv, key_id);
}

std::vector<std::byte>
KmsOracle::Sign(std::string_view key_id, std::span<const std::byte> digest,
		SigningAlgorithm algorithm)
try {
	auto request = MakeKeyRequest(key_id);
	request["Message"] = SodiumBase64(digest);
	request["MessageType"] = "DIGEST";
	request["SigningAlgorithm"] = std::string{ToString(algorithm)};

	const auto response = client.CallJson(KMS_JSON_VERSION,
					      "TrentService.Sign"sv,
					      request);

	auto signature = SodiumDecodeBase64(response["Signature"].asString());
	if (signature.empty())
		throw std::runtime_error{"No Signature in response"};

	logger.Fmt(2, "Key '{}' signed a {}-byte digest with {}",
		   key_id, digest.size(), ToString(algorithm));

	return signature;
} catch (...) {
	ThrowOracleError("Sign"sv, key_id);
}

std::string_view
GetKmsKeyRegion(std::string_view key_id) noexcept
{
	constexpr auto prefix = "arn:"sv;
	if (!key_id.starts_with(prefix))
		return {};

	/* skip "arn:<partition>:kms:" */
	std::string_view rest = key_id.substr(prefix.size());
	for (unsigned i = 0; i < 2; ++i) {
		const auto colon = rest.find(':');
		if (colon == rest.npos)
			return {};
		rest = rest.substr(colon + 1);
	}

	return rest.substr(0, rest.find(':'));
}
