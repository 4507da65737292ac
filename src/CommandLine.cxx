// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Error.hxx"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>

#include <getopt.h>
#include <stdlib.h>

/* long options without a short equivalent */
enum {
	OPTION_COUNTRY = 0x100,
	OPTION_STATE,
	OPTION_LOCALITY,
	OPTION_ORG,
	OPTION_ORG_UNIT,
	OPTION_EMAIL,
	OPTION_SAN,
	OPTION_SERIAL,
	OPTION_CA,
	OPTION_SIGNER,
	OPTION_REQUIRE_RSA,
	OPTION_PKCS11_LABEL,
	OPTION_PKCS11_MODULE,
	OPTION_OPENSSL_CONFIG,
	OPTION_PKCS11_DEBUG,
	OPTION_ENGINE,
	OPTION_VERBOSE,
	OPTION_QUIET,
};

template<typename T>
static T
ParseUnsigned(const char *s, const char *option)
{
	const std::string_view sv{s};
	T value{};
	const auto [end, error] = std::from_chars(sv.data(), sv.data() + sv.size(),
						   value);
	if (error != std::errc{} || end != sv.data() + sv.size() || sv.empty())
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   fmt::format("Bad number for {}: {:?}",
					       option, sv)};

	return value;
}

[[noreturn]]
static void
ThrowBadOption(int argc, char **argv)
{
	if (optopt != 0)
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   fmt::format("Bad option '-{}' (try --help)",
					       static_cast<char>(optopt))};

	const char *arg = optind > 0 && optind <= argc ? argv[optind - 1] : "?";
	throw KmsCertError{ErrorCode::INPUT_VALIDATION,
			   fmt::format("Bad option '{}' (try --help)", arg)};
}

static void
CheckNoArguments(int argc, char **argv)
{
	if (optind < argc)
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   fmt::format("Unexpected argument '{}'",
					       argv[optind])};
}

[[noreturn]]
static void
PrintUsageAndExit(const char *usage)
{
	fmt::print("{}", usage);
	exit(EXIT_SUCCESS);
}

static constexpr char issue_usage[] = R"(Usage: kmscert-issue -k KEY -c NAME [OPTIONS]

Issue a self-signed X.509 certificate for a KMS key.

  -k, --kms-key-id KEY      the KMS key id, ARN or alias
  -c, --cert-common-name N  the subject common name (CN)
  -v, --validity-days DAYS  validity in days (default 9125)
  -o, --output DEST         where to write the certificate
                            (default file:self_signed_certificate.pem)
      --cert-country C      subject country (C)
      --cert-state ST       subject state (ST)
      --cert-locality L     subject locality (L)
      --cert-org O          subject organization (O)
      --cert-org-unit OU    subject organizational unit (OU)
      --cert-email ADDR     subject email address
      --cert-san NAME       add a DNS subject alternative name
                            (may be repeated)
      --cert-serial N       the serial number (default 1)
      --cert-ca             issue a CA certificate
      --signer engine|kms   sign through the PKCS#11 ENGINE (default)
                            or with direct KMS Sign calls
      --require-rsa         fail unless the key is an RSA key
      --pkcs11-label LABEL  the PKCS#11 token label
      --pkcs11-module PATH  the PKCS#11 module
      --openssl-config PATH load this OpenSSL configuration file
      --pkcs11-debug        verbose ENGINE output
      --engine ID           the OpenSSL ENGINE id (default pkcs11)
      --verbose             print debug messages
      --quiet               print only errors
  -h, --help                show this help

Destinations: stdout, -, json[:FIELD], file:[json:]PATH,
post:[json:]URL, s3:[json:]REGION|BUCKET|KEY,
secretsmanager:[json:]REGION|SECRET, sns:[json:]REGION|TOPIC_ARN,
sqs:[json:]REGION|QUEUE_URL, ssm:[json:]REGION|NAME,
dynamodb:[json:]REGION|TABLE|HASH_KEY|HASH_VALUE|SORT_KEY|SORT_VALUE|ATTRIBUTE
(JSON destinations accept an optional trailing |FIELD)
)";

CommandLine<IssueConfig>
ParseIssueCommandLine(int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"kms-key-id", required_argument, nullptr, 'k'},
		{"cert-common-name", required_argument, nullptr, 'c'},
		{"validity-days", required_argument, nullptr, 'v'},
		{"output", required_argument, nullptr, 'o'},
		{"cert-country", required_argument, nullptr, OPTION_COUNTRY},
		{"cert-state", required_argument, nullptr, OPTION_STATE},
		{"cert-locality", required_argument, nullptr, OPTION_LOCALITY},
		{"cert-org", required_argument, nullptr, OPTION_ORG},
		{"cert-org-unit", required_argument, nullptr, OPTION_ORG_UNIT},
		{"cert-email", required_argument, nullptr, OPTION_EMAIL},
		{"cert-san", required_argument, nullptr, OPTION_SAN},
		{"cert-serial", required_argument, nullptr, OPTION_SERIAL},
		{"cert-ca", no_argument, nullptr, OPTION_CA},
		{"signer", required_argument, nullptr, OPTION_SIGNER},
		{"require-rsa", no_argument, nullptr, OPTION_REQUIRE_RSA},
		{"pkcs11-label", required_argument, nullptr, OPTION_PKCS11_LABEL},
		{"pkcs11-module", required_argument, nullptr, OPTION_PKCS11_MODULE},
		{"openssl-config", required_argument, nullptr, OPTION_OPENSSL_CONFIG},
		{"pkcs11-debug", no_argument, nullptr, OPTION_PKCS11_DEBUG},
		{"engine", required_argument, nullptr, OPTION_ENGINE},
		{"verbose", no_argument, nullptr, OPTION_VERBOSE},
		{"quiet", no_argument, nullptr, OPTION_QUIET},
		{"help", no_argument, nullptr, 'h'},
		{},
	};

	CommandLine<IssueConfig> cmdline;
	auto &config = cmdline.config;
	auto &request = config.request;

	opterr = 0;
	int o;
	while ((o = getopt_long(argc, argv, ":k:c:v:o:h",
				long_options, nullptr)) != -1) {
		switch (o) {
		case 'k':
			config.key_id = optarg;
			break;

		case 'c':
			request.common_name = optarg;
			break;

		case 'v':
			request.validity_days = ParseUnsigned<unsigned>(optarg,
									"--validity-days");
			break;

		case 'o':
			config.output = optarg;
			break;

		case OPTION_COUNTRY:
			request.country = optarg;
			break;

		case OPTION_STATE:
			request.state = optarg;
			break;

		case OPTION_LOCALITY:
			request.locality = optarg;
			break;

		case OPTION_ORG:
			request.organization = optarg;
			break;

		case OPTION_ORG_UNIT:
			request.organizational_unit = optarg;
			break;

		case OPTION_EMAIL:
			request.email = optarg;
			break;

		case OPTION_SAN:
			request.subject_alt_names.emplace_back(optarg);
			break;

		case OPTION_SERIAL:
			request.serial = ParseUnsigned<uint64_t>(optarg,
								 "--cert-serial");
			break;

		case OPTION_CA:
			request.is_ca = true;
			break;

		case OPTION_SIGNER:
			config.signer.type = ParseSignerType(optarg);
			break;

		case OPTION_REQUIRE_RSA:
			config.require_rsa = true;
			break;

		case OPTION_PKCS11_LABEL:
			config.signer.engine.pkcs11_label = optarg;
			break;

		case OPTION_PKCS11_MODULE:
			config.signer.engine.pkcs11_module = optarg;
			break;

		case OPTION_OPENSSL_CONFIG:
			config.signer.engine.openssl_config = optarg;
			break;

		case OPTION_PKCS11_DEBUG:
			config.signer.engine.debug = true;
			break;

		case OPTION_ENGINE:
			config.signer.engine.engine_id = optarg;
			break;

		case OPTION_VERBOSE:
			cmdline.log_level = 2;
			break;

		case OPTION_QUIET:
			cmdline.log_level = 0;
			break;

		case 'h':
			PrintUsageAndExit(issue_usage);

		case ':':
			throw KmsCertError{ErrorCode::INPUT_VALIDATION,
					   fmt::format("Option '{}' requires an argument",
						       argv[optind - 1])};

		default:
			ThrowBadOption(argc, argv);
		}
	}

	CheckNoArguments(argc, argv);
	return cmdline;
}

static constexpr char verify_kms_usage[] = R"(Usage: kmscert-verify-kms -k KEY -f CERTIFICATE [OPTIONS]

Check whether the public key of a certificate matches a KMS key.

  -k, --kms-key-id KEY      the KMS key id, ARN or alias
  -f, --certificate PATH    the PEM certificate file
      --verbose             print debug messages
      --quiet               print only errors
  -h, --help                show this help

Exit status: 0 match, 1 error, 2 mismatch, 3 missing or invalid file
)";

CommandLine<VerifyKmsConfig>
ParseVerifyKmsCommandLine(int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"kms-key-id", required_argument, nullptr, 'k'},
		{"certificate", required_argument, nullptr, 'f'},
		{"verbose", no_argument, nullptr, OPTION_VERBOSE},
		{"quiet", no_argument, nullptr, OPTION_QUIET},
		{"help", no_argument, nullptr, 'h'},
		{},
	};

	CommandLine<VerifyKmsConfig> cmdline;

	opterr = 0;
	int o;
	while ((o = getopt_long(argc, argv, ":k:f:h",
				long_options, nullptr)) != -1) {
		switch (o) {
		case 'k':
			cmdline.config.key_id = optarg;
			break;

		case 'f':
			cmdline.config.certificate_path = optarg;
			break;

		case OPTION_VERBOSE:
			cmdline.log_level = 2;
			break;

		case OPTION_QUIET:
			cmdline.log_level = 0;
			break;

		case 'h':
			PrintUsageAndExit(verify_kms_usage);

		case ':':
			throw KmsCertError{ErrorCode::INPUT_VALIDATION,
					   fmt::format("Option '{}' requires an argument",
						       argv[optind - 1])};

		default:
			ThrowBadOption(argc, argv);
		}
	}

	CheckNoArguments(argc, argv);
	return cmdline;
}

static constexpr char verify_file_usage[] = R"(Usage: kmscert-verify-file -f CERTIFICATE -p KEYFILE [OPTIONS]

Check whether the public key of a certificate matches a key file
(PEM public key, PEM private key or DER SubjectPublicKeyInfo).

  -f, --certificate PATH    the PEM certificate file
  -p, --key-file PATH       the key file
      --verbose             print debug messages
      --quiet               print only errors
  -h, --help                show this help

Exit status: 0 match, 1 error, 2 mismatch, 3 missing or invalid file
)";

CommandLine<VerifyFileConfig>
ParseVerifyFileCommandLine(int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"certificate", required_argument, nullptr, 'f'},
		{"key-file", required_argument, nullptr, 'p'},
		{"verbose", no_argument, nullptr, OPTION_VERBOSE},
		{"quiet", no_argument, nullptr, OPTION_QUIET},
		{"help", no_argument, nullptr, 'h'},
		{},
	};

	CommandLine<VerifyFileConfig> cmdline;

	opterr = 0;
	int o;
	while ((o = getopt_long(argc, argv, ":f:p:h",
				long_options, nullptr)) != -1) {
		switch (o) {
		case 'f':
			cmdline.config.certificate_path = optarg;
			break;

		case 'p':
			cmdline.config.key_path = optarg;
			break;

		case OPTION_VERBOSE:
			cmdline.log_level = 2;
			break;

		case OPTION_QUIET:
			cmdline.log_level = 0;
			break;

		case 'h':
			PrintUsageAndExit(verify_file_usage);

		case ':':
			throw KmsCertError{ErrorCode::INPUT_VALIDATION,
					   fmt::format("Option '{}' requires an argument",
						       argv[optind - 1])};

		default:
			ThrowBadOption(argc, argv);
		}
	}

	CheckNoArguments(argc, argv);
	return cmdline;
}
