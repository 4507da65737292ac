// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Target.hxx"
#include "Error.hxx"

#include <fmt/core.h>

#include <optional>
#include <vector>

using std::string_view_literals::operator""sv;

static constexpr std::optional<std::string_view>
StripPrefix(std::string_view s, std::string_view prefix) noexcept
{
	if (!s.starts_with(prefix))
		return std::nullopt;

	return s.substr(prefix.size());
}

static void
RequireNonEmpty(std::string_view value, std::string_view name)
{
	if (value.empty())
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   fmt::format("Empty {}", name)};
}

/**
 * Split a destination into its '|' separated fields.
 *
 * @param n the number of address fields
 * @param json_field if not nullptr, then one more field is allowed:
 * the JSON field name, which is stored here
 */
static std::vector<std::string>
SplitFields(std::string_view src, std::size_t n, std::string *json_field)
{
	std::vector<std::string> fields;

	if (n == 1 && json_field == nullptr) {
		/* a single field may contain '|' */
		fields.emplace_back(src);
		return fields;
	}

	while (true) {
		const auto pipe = src.find('|');
		fields.emplace_back(src.substr(0, pipe));
		if (pipe == src.npos)
			break;
		src = src.substr(pipe + 1);
	}

	if (json_field != nullptr && fields.size() == n + 1) {
		RequireNonEmpty(fields.back(), "JSON field name"sv);
		*json_field = std::move(fields.back());
		fields.pop_back();
	}

	if (fields.size() != n)
		throw KmsCertError{ErrorCode::INPUT_VALIDATION,
				   fmt::format("Expected {} fields, got {}",
					       n, fields.size())};

	return fields;
}

/**
 * Describes how to build a destination from its address fields.
 */
template<typename T>
struct TargetTraits;

template<>
struct TargetTraits<FileTarget> {
	static constexpr std::size_t n_fields = 1;

	static FileTarget Make(std::vector<std::string> &&f) {
		RequireNonEmpty(f[0], "path"sv);
		return {std::move(f[0])};
	}
};

template<>
struct TargetTraits<HttpPostTarget> {
	static constexpr std::size_t n_fields = 1;

	static HttpPostTarget Make(std::vector<std::string> &&f) {
		RequireNonEmpty(f[0], "URL"sv);
		return {std::move(f[0])};
	}
};

template<>
struct TargetTraits<S3Target> {
	static constexpr std::size_t n_fields = 3;

	static S3Target Make(std::vector<std::string> &&f) {
		RequireNonEmpty(f[1], "bucket"sv);
		RequireNonEmpty(f[2], "object key"sv);
		return {std::move(f[0]), std::move(f[1]), std::move(f[2])};
	}
};

template<>
struct TargetTraits<SecretsManagerTarget> {
	static constexpr std::size_t n_fields = 2;

	static SecretsManagerTarget Make(std::vector<std::string> &&f) {
		RequireNonEmpty(f[1], "secret id"sv);
		return {std::move(f[0]), std::move(f[1])};
	}
};

template<>
struct TargetTraits<SnsTarget> {
	static constexpr std::size_t n_fields = 2;

	static SnsTarget Make(std::vector<std::string> &&f) {
		RequireNonEmpty(f[1], "topic ARN"sv);
		return {std::move(f[0]), std::move(f[1])};
	}
};

template<>
struct TargetTraits<SqsTarget> {
	static constexpr std::size_t n_fields = 2;

	static SqsTarget Make(std::vector<std::string> &&f) {
		RequireNonEmpty(f[1], "queue URL"sv);
		return {std::move(f[0]), std::move(f[1])};
	}
};

template<>
struct TargetTraits<SsmTarget> {
	static constexpr std::size_t n_fields = 2;

	static SsmTarget Make(std::vector<std::string> &&f) {
		RequireNonEmpty(f[1], "parameter name"sv);
		return {std::move(f[0]), std::move(f[1])};
	}
};

template<>
struct TargetTraits<DynamoDbTarget> {
	static constexpr std::size_t n_fields = 7;

	static DynamoDbTarget Make(std::vector<std::string> &&f) {
		RequireNonEmpty(f[1], "table"sv);
		RequireNonEmpty(f[2], "hash key"sv);
		RequireNonEmpty(f[3], "hash value"sv);
		RequireNonEmpty(f[6], "attribute"sv);

		if (f[4].empty() != f[5].empty())
			throw KmsCertError{ErrorCode::INPUT_VALIDATION,
					   "Sort key and sort value must both be set or both be empty"};

		/* all three become attributes of the same item */
		if (f[6] == f[2] || f[6] == f[4])
			throw KmsCertError{ErrorCode::INPUT_VALIDATION,
					   "Attribute must differ from the key attributes"};

		if (f[4] == f[2])
			throw KmsCertError{ErrorCode::INPUT_VALIDATION,
					   "Sort key must differ from the hash key"};

		return {
			std::move(f[0]), std::move(f[1]),
			std::move(f[2]), std::move(f[3]),
			std::move(f[4]), std::move(f[5]),
			std::move(f[6]),
		};
	}
};

template<typename T>
static SinkTarget
ParseFields(std::string_view src, bool json)
{
	using Traits = TargetTraits<T>;

	if (json) {
		JsonTarget<T> target;
		target.destination = Traits::Make(SplitFields(src, Traits::n_fields,
							      &target.field));
		return target;
	} else
		return Traits::Make(SplitFields(src, Traits::n_fields, nullptr));
}

/**
 * Try to parse a destination of one kind, identified by its prefix.
 * The "json:" variant is checked first because it has the longer
 * prefix.
 */
template<typename T>
static std::optional<SinkTarget>
TryParse(std::string_view s, std::string_view prefix,
	 std::string_view json_prefix)
{
	if (const auto rest = StripPrefix(s, json_prefix))
		return ParseFields<T>(*rest, true);

	if (const auto rest = StripPrefix(s, prefix))
		return ParseFields<T>(*rest, false);

	return std::nullopt;
}

static SinkTarget
DoParseSinkTarget(std::string_view s)
{
	if (s == "stdout"sv || s == "-"sv)
		return StdoutTarget{};

	if (s == "json"sv)
		return JsonTarget<StdoutTarget>{};

	if (const auto field = StripPrefix(s, "json:"sv)) {
		RequireNonEmpty(*field, "JSON field name"sv);
		return JsonTarget<StdoutTarget>{{}, std::string{*field}};
	}

	if (auto t = TryParse<FileTarget>(s, "file:"sv, "file:json:"sv))
		return std::move(*t);

	if (auto t = TryParse<HttpPostTarget>(s, "post:"sv, "post:json:"sv))
		return std::move(*t);

	if (auto t = TryParse<S3Target>(s, "s3:"sv, "s3:json:"sv))
		return std::move(*t);

	if (auto t = TryParse<SecretsManagerTarget>(s, "secretsmanager:"sv,
						    "secretsmanager:json:"sv))
		return std::move(*t);

	if (auto t = TryParse<SnsTarget>(s, "sns:"sv, "sns:json:"sv))
		return std::move(*t);

	if (auto t = TryParse<SqsTarget>(s, "sqs:"sv, "sqs:json:"sv))
		return std::move(*t);

	if (auto t = TryParse<SsmTarget>(s, "ssm:"sv, "ssm:json:"sv))
		return std::move(*t);

	if (auto t = TryParse<DynamoDbTarget>(s, "dynamodb:"sv,
					      "dynamodb:json:"sv))
		return std::move(*t);

	throw KmsCertError{ErrorCode::INPUT_VALIDATION,
			   "Unrecognized destination type"};
}

SinkTarget
ParseSinkTarget(std::string_view s)
try {
	return DoParseSinkTarget(s);
} catch (...) {
	std::throw_with_nested(KmsCertError{ErrorCode::INPUT_VALIDATION,
					    fmt::format("Malformed output destination {:?}", s)});
}

static std::string_view
DescribeRegion(const std::string &region) noexcept
{
	return region.empty() ? "default region"sv : std::string_view{region};
}

static std::string
Describe(const StdoutTarget &)
{
	return "stdout";
}

static std::string
Describe(const FileTarget &t)
{
	return fmt::format("file {:?}", t.path);
}

static std::string
Describe(const HttpPostTarget &t)
{
	return fmt::format("POST {}", t.url);
}

static std::string
Describe(const S3Target &t)
{
	return fmt::format("s3://{}/{} ({})", t.bucket, t.key,
			   DescribeRegion(t.region));
}

static std::string
Describe(const SecretsManagerTarget &t)
{
	return fmt::format("secret {:?} ({})", t.secret_id,
			   DescribeRegion(t.region));
}

static std::string
Describe(const SnsTarget &t)
{
	return fmt::format("SNS topic {} ({})", t.topic_arn,
			   DescribeRegion(t.region));
}

static std::string
Describe(const SqsTarget &t)
{
	return fmt::format("SQS queue {} ({})", t.queue_url,
			   DescribeRegion(t.region));
}

static std::string
Describe(const SsmTarget &t)
{
	return fmt::format("SSM parameter {:?} ({})", t.name,
			   DescribeRegion(t.region));
}

static std::string
Describe(const DynamoDbTarget &t)
{
	if (t.sort_key.empty())
		return fmt::format("DynamoDB table {:?} item {}={:?} ({})",
				   t.table, t.hash_key, t.hash_value,
				   DescribeRegion(t.region));

	return fmt::format("DynamoDB table {:?} item {}={:?},{}={:?} ({})",
			   t.table, t.hash_key, t.hash_value,
			   t.sort_key, t.sort_value,
			   DescribeRegion(t.region));
}

template<typename T>
static std::string
Describe(const JsonTarget<T> &t)
{
	return fmt::format("{} (JSON field {:?})",
			   Describe(t.destination), t.field);
}

std::string
DescribeSinkTarget(const SinkTarget &target)
{
	return std::visit([](const auto &t){ return Describe(t); }, target);
}
