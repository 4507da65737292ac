// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AwsBackend.hxx"
#include "io/AtomicFile.hxx"
#include "curl/Http.hxx"
#include "util/UriEscape.hxx"

#include <json/value.h>

#include <fmt/core.h>

#include <stdexcept>
#include <system_error>

#include <errno.h>
#include <stdio.h>

using std::string_view_literals::operator""sv;

/* Secrets Manager, SSM and KMS speak awsJson 1.1; SQS and DynamoDB
   speak awsJson 1.0 */
static constexpr std::string_view JSON_1_0 = "1.0"sv;
static constexpr std::string_view JSON_1_1 = "1.1"sv;

bool
IsSecretNotFound(const AwsError &e) noexcept
{
	return e.GetStatus() == 400 && e.IsType("ResourceNotFoundException"sv);
}

bool
IsParameterNotFound(const AwsError &e) noexcept
{
	return e.GetStatus() == 400 && e.IsType("ParameterNotFound"sv);
}

AwsClient &
AwsSinkBackend::GetClient(std::string_view service, std::string_view region)
{
	return clients.try_emplace(std::pair{std::string{service}, std::string{region}},
				   config, service, region).first->second;
}

void
AwsSinkBackend::WriteStdout(std::string_view data)
{
	if (fwrite(data.data(), 1, data.size(), stdout) != data.size() ||
	    fflush(stdout) != 0)
		throw std::system_error{errno, std::system_category(),
					"Failed to write to stdout"};
}

void
AwsSinkBackend::WriteFile(std::string_view path, std::string_view data)
{
	WriteFileAtomic(std::string{path}.c_str(), data);
}

void
AwsSinkBackend::HttpPost(std::string_view url, std::string_view content_type,
			 std::string_view body)
{
	HttpRequest request;
	request.url = url;
	request.headers.emplace_back(fmt::format("Content-Type: {}",
						 content_type));
	request.body = body;

	const auto response = SendHttpRequest(request);
	if (!response.IsSuccess())
		throw std::runtime_error{fmt::format("HTTP status {} from {}",
						     response.status, url)};
}

void
AwsSinkBackend::PutObject(std::string_view region,
			  std::string_view bucket, std::string_view key,
			  std::string_view content_type,
			  std::string_view body)
{
	GetClient("s3"sv, region).PutObject(bucket, key, body, content_type);
}

bool
AwsSinkBackend::SecretExists(std::string_view region,
			     std::string_view secret_id)
{
	Json::Value request{Json::objectValue};
	request["SecretId"] = std::string{secret_id};

	try {
		GetClient("secretsmanager"sv, region)
			.CallJson(JSON_1_1, "secretsmanager.DescribeSecret"sv,
				  request);
		return true;
	} catch (const AwsError &e) {
		if (IsSecretNotFound(e))
			return false;
		throw;
	}
}

void
AwsSinkBackend::CreateSecret(std::string_view region, std::string_view name,
			     std::string_view value)
{
	Json::Value request{Json::objectValue};
	request["Name"] = std::string{name};
	request["SecretString"] = std::string{value};

	GetClient("secretsmanager"sv, region)
		.CallJson(JSON_1_1, "secretsmanager.CreateSecret"sv, request);
}

void
AwsSinkBackend::PutSecretValue(std::string_view region,
			       std::string_view secret_id,
			       std::string_view value)
{
	Json::Value request{Json::objectValue};
	request["SecretId"] = std::string{secret_id};
	request["SecretString"] = std::string{value};

	GetClient("secretsmanager"sv, region)
		.CallJson(JSON_1_1, "secretsmanager.PutSecretValue"sv, request);
}

bool
AwsSinkBackend::ParameterExists(std::string_view region,
				std::string_view name)
{
	Json::Value request{Json::objectValue};
	request["Name"] = std::string{name};

	try {
		GetClient("ssm"sv, region)
			.CallJson(JSON_1_1, "AmazonSSM.GetParameter"sv, request);
		return true;
	} catch (const AwsError &e) {
		if (IsParameterNotFound(e))
			return false;
		throw;
	}
}

void
AwsSinkBackend::PutParameter(std::string_view region, std::string_view name,
			     std::string_view value, bool overwrite)
{
	Json::Value request{Json::objectValue};
	request["Name"] = std::string{name};
	request["Value"] = std::string{value};
	request["Type"] = "String";
	request["Overwrite"] = overwrite;

	/* certificates may exceed the 4 kB limit of the standard
	   tier */
	if (value.size() > 4096)
		request["Tier"] = "Advanced";

	GetClient("ssm"sv, region)
		.CallJson(JSON_1_1, "AmazonSSM.PutParameter"sv, request);
}

void
AwsSinkBackend::Publish(std::string_view region, std::string_view topic_arn,
			std::string_view message)
{
	const auto form = fmt::format("Action=Publish&Version=2010-03-31"
				      "&TopicArn={}&Message={}",
				      UriEscape(topic_arn), UriEscape(message));

	GetClient("sns"sv, region).CallQuery(form);
}

void
AwsSinkBackend::SendMessage(std::string_view region,
			    std::string_view queue_url,
			    std::string_view body)
{
	Json::Value request{Json::objectValue};
	request["QueueUrl"] = std::string{queue_url};
	request["MessageBody"] = std::string{body};

	GetClient("sqs"sv, region)
		.CallJson(JSON_1_0, "AmazonSQS.SendMessage"sv, request);
}

void
AwsSinkBackend::PutItem(std::string_view region, std::string_view table,
			const std::vector<std::pair<std::string_view, std::string_view>> &attributes)
{
	Json::Value item{Json::objectValue};
	for (const auto &[name, value] : attributes)
		item[std::string{name}]["S"] = std::string{value};

	Json::Value request{Json::objectValue};
	request["TableName"] = std::string{table};
	request["Item"] = std::move(item);

	GetClient("dynamodb"sv, region)
		.CallJson(JSON_1_0, "DynamoDB_20120810.PutItem"sv, request);
}
