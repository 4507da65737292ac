// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Factory.hxx"
#include "OracleKey.hxx"
#include "Error.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

SignerType
ParseSignerType(std::string_view s)
{
	if (s == "engine"sv)
		return SignerType::ENGINE;
	else if (s == "kms"sv)
		return SignerType::ORACLE;
	else
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   fmt::format("Unknown signer {:?}", s)};
}

std::unique_ptr<SigningKey>
OpenSigningKey(const SignerConfig &config, SigningOracle &oracle,
	       const KeyDescriptor &key, SigningAlgorithm algorithm)
{
	switch (config.type) {
	case SignerType::ENGINE:
		return std::make_unique<EngineSigningKey>(config.engine, key);

	case SignerType::ORACLE:
		return std::make_unique<OracleSigningKey>(oracle, key,
							  algorithm);
	}

	throw std::invalid_argument{"Bad signer type"};
}
