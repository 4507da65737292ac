// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "sink/Backend.hxx"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * A #SinkBackend which keeps everything in memory.  Stateful stores
 * are keyed by "region|name".
 */
class MemoryBackend final : public SinkBackend {
public:
	struct Request {
		std::string destination, content_type, body;
	};

	std::string stdout_data;
	std::map<std::string, std::string> files;
	std::vector<Request> posts, objects, messages, notifications;
	std::map<std::string, std::string> secrets, parameters;
	std::map<std::string, std::map<std::string, std::string>> items;

	unsigned n_secret_creates = 0, n_secret_updates = 0;
	unsigned n_parameter_creates = 0, n_parameter_overwrites = 0;

	/**
	 * Let the existence probes fail with something other than
	 * "not found" (e.g. missing permissions).
	 */
	bool fail_probe = false;

	/**
	 * Let all writes fail.
	 */
	bool fail_write = false;

	static std::string MakeKey(std::string_view region,
				   std::string_view name) {
		std::string key{region};
		key.push_back('|');
		key.append(name);
		return key;
	}

	void WriteStdout(std::string_view data) override {
		CheckWrite();
		stdout_data.append(data);
	}

	void WriteFile(std::string_view path, std::string_view data) override {
		CheckWrite();
		files[std::string{path}] = data;
	}

	void HttpPost(std::string_view url, std::string_view content_type,
		      std::string_view body) override {
		CheckWrite();
		posts.push_back({std::string{url}, std::string{content_type},
				 std::string{body}});
	}

	void PutObject(std::string_view region,
		       std::string_view bucket, std::string_view key,
		       std::string_view content_type,
		       std::string_view body) override {
		CheckWrite();
		objects.push_back({MakeKey(region, MakeKey(bucket, key)),
				   std::string{content_type},
				   std::string{body}});
	}

	bool SecretExists(std::string_view region,
			  std::string_view secret_id) override {
		CheckProbe();
		return secrets.contains(MakeKey(region, secret_id));
	}

	void CreateSecret(std::string_view region, std::string_view name,
			  std::string_view value) override {
		CheckWrite();

		auto [i, inserted] = secrets.try_emplace(MakeKey(region, name),
							 value);
		if (!inserted)
			throw std::runtime_error{"ResourceExistsException"};

		++n_secret_creates;
	}

	void PutSecretValue(std::string_view region, std::string_view secret_id,
			    std::string_view value) override {
		CheckWrite();

		auto i = secrets.find(MakeKey(region, secret_id));
		if (i == secrets.end())
			throw std::runtime_error{"ResourceNotFoundException"};

		i->second = value;
		++n_secret_updates;
	}

	bool ParameterExists(std::string_view region,
			     std::string_view name) override {
		CheckProbe();
		return parameters.contains(MakeKey(region, name));
	}

	void PutParameter(std::string_view region, std::string_view name,
			  std::string_view value, bool overwrite) override {
		CheckWrite();

		const auto key = MakeKey(region, name);
		if (!overwrite && parameters.contains(key))
			throw std::runtime_error{"ParameterAlreadyExists"};

		parameters[key] = value;
		if (overwrite)
			++n_parameter_overwrites;
		else
			++n_parameter_creates;
	}

	void Publish(std::string_view region, std::string_view topic_arn,
		     std::string_view message) override {
		CheckWrite();
		notifications.push_back({MakeKey(region, topic_arn), {},
					 std::string{message}});
	}

	void SendMessage(std::string_view region, std::string_view queue_url,
			 std::string_view body) override {
		CheckWrite();
		messages.push_back({MakeKey(region, queue_url), {},
				    std::string{body}});
	}

	void PutItem(std::string_view region, std::string_view table,
		     const std::vector<std::pair<std::string_view, std::string_view>> &attributes) override {
		CheckWrite();

		/* the first attribute is the hash key */
		const auto &[hash_key, hash_value] = attributes.front();
		auto &item = items[MakeKey(region, MakeKey(table, MakeKey(hash_key, hash_value)))];
		item.clear();
		for (const auto &[name, value] : attributes)
			item[std::string{name}] = value;
	}

private:
	void CheckProbe() const {
		if (fail_probe)
			throw std::runtime_error{"AccessDeniedException"};
	}

	void CheckWrite() const {
		if (fail_write)
			throw std::runtime_error{"Service unavailable"};
	}
};
