// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <json/value.h>

#include <string>
#include <string_view>

/**
 * Serialize a JSON value without any whitespace.
 */
std::string
ToCompactJson(const Json::Value &value);

/**
 * Parse a JSON document.  Throws std::runtime_error on syntax errors.
 */
Json::Value
ParseJson(std::string_view src);
