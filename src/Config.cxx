// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "Error.hxx"

static void
CheckRequired(const std::string &value, const char *option)
{
	if (value.empty())
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   std::string{"Missing option "} + option};
}

void
IssueConfig::Check() const
{
	CheckRequired(key_id, "--kms-key-id");
	CheckRequired(request.common_name, "--cert-common-name");
	CheckRequired(output, "--output");

	request.Check();
}

void
VerifyKmsConfig::Check() const
{
	CheckRequired(key_id, "--kms-key-id");
	CheckRequired(certificate_path, "--certificate");
}

void
VerifyFileConfig::Check() const
{
	CheckRequired(certificate_path, "--certificate");
	CheckRequired(key_path, "--key-file");
}
