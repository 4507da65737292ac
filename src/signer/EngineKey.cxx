// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "EngineKey.hxx"
#include "Error.hxx"
#include "Log.hxx"
#include "key/DescribeKey.hxx"
#include "key/Fingerprint.hxx"
#include "key/KeySpec.hxx"
#include "openssl/Error.hxx"
#include "util/UriEscape.hxx"

#include <openssl/conf.h>

#include <fmt/core.h>

static constexpr Logger logger{"engine"};

std::string
MakePkcs11KeyUri(std::string_view token_label)
{
	if (token_label.empty())
		return "pkcs11:type=private";

	return fmt::format("pkcs11:token={};type=private",
			   UriEscape(token_label));
}

static void
LoadOpenSslConfig(const char *path)
{
	if (CONF_modules_load_file(path, nullptr, 0) <= 0)
		throw SslError{fmt::format("Failed to load OpenSSL configuration '{}'",
					   path)};
}

static void
EngineControl(ENGINE &e, const char *cmd, const char *arg)
{
	if (!ENGINE_ctrl_cmd_string(&e, cmd, arg, 0))
		throw SslError{fmt::format("ENGINE command {} failed", cmd)};
}

static UniqueENGINE
OpenEngine(const EngineConfig &config)
{
	if (!config.openssl_config.empty())
		LoadOpenSslConfig(config.openssl_config.c_str());

	ENGINE_load_builtin_engines();

	/* structural reference */
	ENGINE *e = ENGINE_by_id(config.engine_id.c_str());
	if (e == nullptr)
		throw SslError{fmt::format("ENGINE '{}' not found",
					   config.engine_id)};

	try {
		if (config.debug)
			EngineControl(*e, "VERBOSE", nullptr);

		if (!config.pkcs11_module.empty())
			EngineControl(*e, "MODULE_PATH",
				      config.pkcs11_module.c_str());
	} catch (...) {
		ENGINE_free(e);
		throw;
	}

	/* functional reference */
	if (!ENGINE_init(e)) {
		SslError error{fmt::format("ENGINE_init('{}') failed",
					   config.engine_id)};
		ENGINE_free(e);
		throw error;
	}

	return UniqueENGINE{e};
}

EngineSigningKey::EngineSigningKey(const EngineConfig &config,
				   const KeyDescriptor &descriptor)
try {
	engine = OpenEngine(config);

	const auto uri = MakePkcs11KeyUri(config.pkcs11_label);
	logger.Fmt(2, "Loading private key {:?} from ENGINE '{}'",
		   uri, config.engine_id);

	key.reset(ENGINE_load_private_key(engine.get(), uri.c_str(),
					  nullptr, nullptr));
	if (!key)
		throw SslError{fmt::format("Failed to load private key {:?}", uri)};

	logger.Fmt(2, "Loaded key {}", GetFingerprint(*key));

	CheckKeyMatchesDescriptor(*key, descriptor);
} catch (const KmsCertError &) {
	throw;
} catch (...) {
	std::throw_with_nested(KmsCertError{ErrorCode::SIGNING_FAILED,
					    fmt::format("Failed to open signing key '{}' via ENGINE",
							descriptor.key_id)});
}
