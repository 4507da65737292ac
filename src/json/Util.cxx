// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Util.hxx"

#include <json/reader.h>
#include <json/writer.h>

#include <memory>
#include <stdexcept>

std::string
ToCompactJson(const Json::Value &value)
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	builder["emitUTF8"] = true;
	return Json::writeString(builder, value);
}

Json::Value
ParseJson(std::string_view src)
{
	Json::CharReaderBuilder builder;
	const std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

	Json::Value root;
	std::string errors;
	if (!reader->parse(src.data(), src.data() + src.size(), &root, &errors))
		throw std::runtime_error{"Malformed JSON: " + errors};

	return root;
}
