// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Verify.hxx"
#include "Log.hxx"

static constexpr Logger logger{"kmscert-verify-file"};

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseVerifyFileCommandLine(argc, argv);
	SetLogLevel(cmdline.log_level);

	const auto &config = cmdline.config;
	config.Check();

	return GetVerifyExitCode(VerifyCertificateWithKeyFile(config.certificate_path.c_str(),
							      config.key_path.c_str()));
} catch (const std::exception &e) {
	logger(0, std::current_exception());
	return GetVerifyExitCode(e);
} catch (...) {
	logger(0, std::current_exception());
	return VERIFY_EXIT_ERROR;
}
