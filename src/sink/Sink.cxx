// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Sink.hxx"
#include "Backend.hxx"
#include "Error.hxx"
#include "Log.hxx"
#include "json/Util.hxx"

#include <json/value.h>

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

static constexpr Logger logger{"sink"};

static constexpr std::string_view PEM_CONTENT_TYPE = "application/x-pem-file"sv;
static constexpr std::string_view JSON_CONTENT_TYPE = "application/json"sv;

std::string
WrapCertificateJson(std::string_view pem, std::string_view field)
{
	Json::Value root{Json::objectValue};
	root[std::string{field}] = std::string{pem};
	return ToCompactJson(root);
}

namespace {

class SinkWriter {
	SinkBackend &backend;
	const std::string_view pem;

public:
	SinkWriter(SinkBackend &_backend, std::string_view _pem) noexcept
		:backend(_backend), pem(_pem) {}

	template<typename T>
	void operator()(const T &t) {
		Write(t, pem, PEM_CONTENT_TYPE);
	}

	template<typename T>
	void operator()(const JsonTarget<T> &t) {
		Write(t.destination, WrapCertificateJson(pem, t.field),
		      JSON_CONTENT_TYPE);
	}

private:
	/**
	 * Append a newline for line based destinations, because the
	 * JSON serializer does not emit one.
	 */
	static std::string WithNewline(std::string_view payload) {
		std::string result{payload};
		if (!result.ends_with('\n'))
			result.push_back('\n');
		return result;
	}

	void Write(const StdoutTarget &, std::string_view payload,
		   std::string_view) {
		backend.WriteStdout(WithNewline(payload));
	}

	void Write(const FileTarget &t, std::string_view payload,
		   std::string_view) {
		backend.WriteFile(t.path, WithNewline(payload));
	}

	void Write(const HttpPostTarget &t, std::string_view payload,
		   std::string_view content_type) {
		backend.HttpPost(t.url, content_type, payload);
	}

	void Write(const S3Target &t, std::string_view payload,
		   std::string_view content_type) {
		backend.PutObject(t.region, t.bucket, t.key,
				  content_type, payload);
	}

	void Write(const SecretsManagerTarget &t, std::string_view payload,
		   std::string_view) {
		if (backend.SecretExists(t.region, t.secret_id)) {
			logger.Fmt(2, "Updating existing secret {:?}",
				   t.secret_id);
			backend.PutSecretValue(t.region, t.secret_id, payload);
		} else {
			logger.Fmt(2, "Creating secret {:?}", t.secret_id);
			backend.CreateSecret(t.region, t.secret_id, payload);
		}
	}

	void Write(const SnsTarget &t, std::string_view payload,
		   std::string_view) {
		backend.Publish(t.region, t.topic_arn, payload);
	}

	void Write(const SqsTarget &t, std::string_view payload,
		   std::string_view) {
		backend.SendMessage(t.region, t.queue_url, payload);
	}

	void Write(const SsmTarget &t, std::string_view payload,
		   std::string_view) {
		const bool exists = backend.ParameterExists(t.region, t.name);
		logger.Fmt(2, "{} parameter {:?}",
			   exists ? "Overwriting"sv : "Creating"sv, t.name);
		backend.PutParameter(t.region, t.name, payload, exists);
	}

	void Write(const DynamoDbTarget &t, std::string_view payload,
		   std::string_view) {
		std::vector<std::pair<std::string_view, std::string_view>> attributes{
			{t.hash_key, t.hash_value},
		};

		if (!t.sort_key.empty())
			attributes.emplace_back(t.sort_key, t.sort_value);

		attributes.emplace_back(t.attribute, payload);

		backend.PutItem(t.region, t.table, attributes);
	}
};

} // anonymous namespace

void
WriteCertificate(const SinkTarget &target, std::string_view pem,
		 SinkBackend &backend)
try {
	logger.Fmt(2, "Writing certificate to {}", DescribeSinkTarget(target));

	std::visit(SinkWriter{backend, pem}, target);
} catch (...) {
	std::throw_with_nested(KmsCertError{ErrorCode::SINK_WRITE_FAILED,
					    fmt::format("Failed to write certificate to {}",
							DescribeSinkTarget(target))});
}
