// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LocalKey.hxx"
#include "Error.hxx"
#include "key/KeySpec.hxx"
#include "openssl/Pem.hxx"
#include "SignDigest.hxx"
#include "oracle/Oracle.hxx"

#include <map>
#include <string>

/**
 * A #SigningOracle which holds local private keys.
 */
class FakeOracle final : public SigningOracle {
	struct Entry {
		UniqueEVP_PKEY key;
		std::string spec, usage;
	};

	std::map<std::string, Entry, std::less<>> keys;

public:
	unsigned n_describe = 0, n_get_public_key = 0, n_sign = 0;

	/**
	 * Let Sign() fail like a throttled service.
	 */
	bool fail_sign = false;

	/**
	 * Let Sign() return a damaged signature.
	 */
	bool corrupt_signature = false;

	EVP_PKEY &Add(std::string_view key_id, UniqueEVP_PKEY key,
		      std::string_view spec,
		      std::string_view usage="SIGN_VERIFY") {
		auto &entry = keys[std::string{key_id}];
		entry.key = std::move(key);
		entry.spec = spec;
		entry.usage = usage;
		return *entry.key;
	}

	EVP_PKEY &GetKey(std::string_view key_id) {
		return *Find(key_id).key;
	}

	KeyDescriptor DescribeKey(std::string_view key_id) override {
		++n_describe;
		const auto &entry = Find(key_id);
		return KeyDescriptor::Make(key_id, entry.spec, entry.usage);
	}

	std::vector<std::byte> GetPublicKey(std::string_view key_id) override {
		++n_get_public_key;
		return PublicKeyToDer(*Find(key_id).key);
	}

	std::vector<std::byte> Sign(std::string_view key_id,
				    std::span<const std::byte> digest,
				    SigningAlgorithm algorithm) override {
		++n_sign;

		if (fail_sign)
			throw KmsCertError{ErrorCode::ORACLE_CALL_FAILED,
					   "ThrottlingException"};

		auto signature = SignDigest(*Find(key_id).key,
					    GetDigestAlgorithm(algorithm),
					    digest);
		if (corrupt_signature)
			signature[signature.size() / 2] ^= std::byte{0x55};
		return signature;
	}

private:
	Entry &Find(std::string_view key_id) {
		auto i = keys.find(key_id);
		if (i == keys.end())
			throw KmsCertError{ErrorCode::ORACLE_CALL_FAILED,
					   "NotFoundException"};
		return i->second;
	}
};
