// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Config.hxx"

template<typename C>
struct CommandLine {
	C config;

	/**
	 * See SetLogLevel().
	 */
	unsigned log_level = 1;
};

/*
 * The command line parsers print usage text and exit on "--help";
 * all other problems throw #KmsCertError with INPUT_VALIDATION.
 */

CommandLine<IssueConfig>
ParseIssueCommandLine(int argc, char **argv);

CommandLine<VerifyKmsConfig>
ParseVerifyKmsCommandLine(int argc, char **argv);

CommandLine<VerifyFileConfig>
ParseVerifyFileCommandLine(int argc, char **argv);
