// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Verify.hxx"
#include "Log.hxx"
#include "aws/Config.hxx"
#include "curl/Global.hxx"
#include "oracle/KmsOracle.hxx"

static constexpr Logger logger{"kmscert-verify-kms"};

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseVerifyKmsCommandLine(argc, argv);
	SetLogLevel(cmdline.log_level);

	const auto &config = cmdline.config;
	config.Check();

	const ScopeCurlInit curl_init;
	const auto aws_config = LoadAwsConfigFromEnvironment();

	KmsOracle oracle{aws_config, GetKmsKeyRegion(config.key_id)};

	return GetVerifyExitCode(VerifyCertificateWithKms(oracle, config.key_id,
							  config.certificate_path.c_str()));
} catch (const std::exception &e) {
	logger(0, std::current_exception());
	return GetVerifyExitCode(e);
} catch (...) {
	logger(0, std::current_exception());
	return VERIFY_EXIT_ERROR;
}
