// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Client.hxx"
#include "Config.hxx"
#include "Digest.hxx"
#include "Error.hxx"
#include "curl/Http.hxx"
#include "json/Util.hxx"
#include "util/UriEscape.hxx"
#include "Log.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

static constexpr Logger logger{"aws"};

AwsError::AwsError(unsigned _status, std::string_view _type,
		   const std::string &_msg)
	:std::runtime_error(_msg), status(_status), type(_type)
{
}

AwsClient::AwsClient(const AwsConfig &_config, std::string_view _service,
		     std::string_view _region)
	:config(_config), service(_service),
	 region(_region.empty() ? config.region : std::string{_region})
{
	if (region.empty())
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   fmt::format("No AWS region configured for {}", service)};

	if (!config.HasCredentials())
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   "AWS credentials missing (AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY)"};
}

std::string
AwsClient::GetServiceURL() const
{
	if (!config.endpoint_url.empty())
		return config.endpoint_url + "/";

	return fmt::format("https://{}.{}.amazonaws.com/", service, region);
}

static void
PrepareSignedRequest(HttpRequest &request, const AwsConfig &config,
		     std::string_view service, std::string_view region)
{
	request.aws_sigv4 = fmt::format("aws:amz:{}:{}", region, service);
	request.user = config.access_key_id;
	request.password = config.secret_access_key;

	if (!config.session_token.empty())
		request.headers.emplace_back(fmt::format("X-Amz-Security-Token: {}",
							 config.session_token));
}

/**
 * Strip the namespace from an awsJson error type,
 * e.g. "com.amazonaws.kms#NotFoundException".
 */
static constexpr std::string_view
StripErrorTypeNamespace(std::string_view type) noexcept
{
	if (const auto hash = type.rfind('#'); hash != type.npos)
		type = type.substr(hash + 1);

	/* some services append details after a colon */
	if (const auto colon = type.find(':'); colon != type.npos)
		type = type.substr(0, colon);

	return type;
}

/**
 * Extract the contents of an XML element from an awsQuery error
 * response.
 */
static std::string_view
FindXmlElement(std::string_view xml, std::string_view name) noexcept
{
	const auto open = fmt::format("<{}>", name);
	const auto begin = xml.find(open);
	if (begin == xml.npos)
		return {};

	xml = xml.substr(begin + open.size());
	return xml.substr(0, xml.find('<'));
}

AwsError
ParseAwsError(std::string_view service, unsigned status, std::string_view body)
{
	std::string type, message;

	if (body.starts_with('{')) {
		try {
			const auto json = ParseJson(body);
			type = json["__type"].asString();
			message = json.isMember("message")
				? json["message"].asString()
				: json["Message"].asString();
		} catch (const std::runtime_error &) {
			/* not JSON after all; fall back to the raw
			   body below */
		}
	} else {
		type = FindXmlElement(body, "Code"sv);
		message = FindXmlElement(body, "Message"sv);
	}

	if (message.empty())
		message = std::string{body.substr(0, 256)};

	type = std::string{StripErrorTypeNamespace(type)};

	return AwsError{status, type,
			fmt::format("{} error {} {}: {}", service, status,
				    type, message)};
}

void
AwsClient::Throw(unsigned status, std::string_view body) const
{
	throw ParseAwsError(service, status, body);
}

Json::Value
AwsClient::CallJson(std::string_view json_version, std::string_view target,
		    const Json::Value &request_body)
{
	const auto body = ToCompactJson(request_body);

	HttpRequest request;
	request.url = GetServiceURL();
	request.headers.emplace_back(fmt::format("Content-Type: application/x-amz-json-{}",
						 json_version));
	request.headers.emplace_back(fmt::format("X-Amz-Target: {}", target));
	request.body = body;
	PrepareSignedRequest(request, config, service, region);

	logger.Fmt(2, "{} {} ({})", service, target, region);

	const auto response = SendHttpRequest(request);
	if (!response.IsSuccess())
		Throw(response.status, response.body);

	if (response.body.empty())
		return Json::Value{Json::objectValue};

	return ParseJson(response.body);
}

std::string
AwsClient::CallQuery(std::string_view form)
{
	HttpRequest request;
	request.url = GetServiceURL();
	request.headers.emplace_back("Content-Type: application/x-www-form-urlencoded; charset=utf-8");
	request.body = form;
	PrepareSignedRequest(request, config, service, region);

	logger.Fmt(2, "{} query ({})", service, region);

	auto response = SendHttpRequest(request);
	if (!response.IsSuccess())
		Throw(response.status, response.body);

	return std::move(response.body);
}

static std::string
HexDigest(std::string_view src)
{
	std::byte digest[DIGEST_MAX_SIZE];
	const std::size_t size = Digest(DigestAlgorithm::SHA256,
					std::as_bytes(std::span{src}), digest);

	std::string result;
	result.reserve(size * 2);
	for (std::size_t i = 0; i < size; ++i)
		result += fmt::format("{:02x}", static_cast<unsigned>(digest[i]));
	return result;
}

void
AwsClient::PutObject(std::string_view bucket, std::string_view key,
		     std::string_view body, std::string_view content_type)
{
	HttpRequest request;
	request.method = "PUT";

	/* path-style with a custom endpoint, virtual-hosted style
	   with AWS */
	if (!config.endpoint_url.empty())
		request.url = fmt::format("{}/{}/{}", config.endpoint_url,
					  bucket, UriEscape(key, true));
	else
		request.url = fmt::format("https://{}.s3.{}.amazonaws.com/{}",
					  bucket, region, UriEscape(key, true));

	request.headers.emplace_back(fmt::format("Content-Type: {}", content_type));
	request.headers.emplace_back(fmt::format("x-amz-content-sha256: {}",
						 HexDigest(body)));
	request.body = body;
	PrepareSignedRequest(request, config, service, region);

	logger.Fmt(2, "s3 PutObject {}/{} ({})", bucket, key, region);

	const auto response = SendHttpRequest(request);
	if (!response.IsSuccess())
		Throw(response.status, response.body);
}
