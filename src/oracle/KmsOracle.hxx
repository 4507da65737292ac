// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Oracle.hxx"
#include "aws/Client.hxx"

/**
 * #SigningOracle implementation talking to AWS KMS.
 */
class KmsOracle final : public SigningOracle {
	AwsClient client;

public:
	/**
	 * @param region the KMS region; empty means the default
	 * region from #AwsConfig
	 */
	explicit KmsOracle(const AwsConfig &config,
			   std::string_view region={});

	KeyDescriptor DescribeKey(std::string_view key_id) override;
	std::vector<std::byte> GetPublicKey(std::string_view key_id) override;
	std::vector<std::byte> Sign(std::string_view key_id,
				    std::span<const std::byte> digest,
				    SigningAlgorithm algorithm) override;
};

/**
 * Extract the region from a KMS key ARN
 * ("arn:aws:kms:<region>:<account>:key/<id>").
 *
 * @return the region or an empty string if this is not an ARN
 */
[[gnu::pure]]
std::string_view
GetKmsKeyRegion(std::string_view key_id) noexcept;
