// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Issue.hxx"
#include "Log.hxx"
#include "aws/Config.hxx"
#include "curl/Global.hxx"
#include "oracle/KmsOracle.hxx"
#include "signer/SigningKey.hxx"
#include "sink/AwsBackend.hxx"

#include <stdlib.h>

static constexpr Logger logger{"kmscert-issue"};

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseIssueCommandLine(argc, argv);
	SetLogLevel(cmdline.log_level);

	const auto &config = cmdline.config;
	config.Check();

	const ScopeCurlInit curl_init;
	const auto aws_config = LoadAwsConfigFromEnvironment();

	KmsOracle oracle{aws_config, GetKmsKeyRegion(config.key_id)};
	AwsSinkBackend backend{aws_config};

	IssueCertificate(config, oracle,
			 [&config, &oracle](const KeyDescriptor &key,
					    SigningAlgorithm algorithm){
				 return OpenSigningKey(config.signer, oracle,
						       key, algorithm);
			 },
			 backend);

	return EXIT_SUCCESS;
} catch (...) {
	logger(0, std::current_exception());
	return EXIT_FAILURE;
}
