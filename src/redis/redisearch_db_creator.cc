#include "redisearch_db_creator.h"

#include <glog/logging.h>

namespace Ftsb {

RediSearchDBCreator::RediSearchDBCreator(std::string host, std::string index_schema)
	: host_(std::move(host)), index_schema_(std::move(index_schema)) {}

void RediSearchDBCreator::Init() {
	std::string host;
	int port = 0;
	if (!ParseHostPort(host_, &host, &port)) {
		LOG(FATAL) << "Invalid redis address \"" << host_ << "\"";
	}
	std::string error;
	connection_ = RedisConnection::Connect(host, port, &error);
	if (!connection_) {
		LOG(FATAL) << "Error preparing the index: " << error;
	}
}

bool RediSearchDBCreator::Run(const RedisCommand& command, std::string* error) {
	RedisReplyPtr reply = connection_->Execute(command, error);
	if (!reply) {
		return false;
	}
	if (reply->type == REDIS_REPLY_ERROR) {
		*error = std::string(reply->str, reply->len);
		return false;
	}
	return true;
}

bool RediSearchDBCreator::DBExists(const std::string& db_name) {
	std::string error;
	bool exists = Run({"FT.INFO", db_name}, &error);
	if (!exists) {
		VLOG(1) << "FT.INFO " << db_name << ": " << error;
	}
	return exists;
}

bool RediSearchDBCreator::RemoveOldDB(const std::string& db_name, std::string* error) {
	return Run({"FT.DROPINDEX", db_name}, error);
}

bool RediSearchDBCreator::CreateDB(const std::string& db_name, std::string* error) {
	RedisCommand command{"FT.CREATE", db_name};
	std::vector<std::string> schema;
	if (!SplitArguments(index_schema_, &schema, error)) {
		return false;
	}
	if (schema.empty()) {
		*error = "no index schema configured";
		return false;
	}
	command.insert(command.end(), schema.begin(), schema.end());
	return Run(command, error);
}

void RediSearchDBCreator::Close() {
	connection_.reset();
}

bool RediSearchDBCreator::SplitArguments(const std::string& text, std::vector<std::string>* args,
		std::string* error) {
	args->clear();
	std::string current;
	bool in_arg = false;
	char quote = 0;

	for (char c : text) {
		if (quote) {
			if (c == quote) {
				quote = 0;
			} else {
				current.push_back(c);
			}
		} else if (c == '"' || c == '\'') {
			quote = c;
			in_arg = true;
		} else if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
			if (in_arg) {
				args->push_back(std::move(current));
				current.clear();
				in_arg = false;
			}
		} else {
			current.push_back(c);
			in_arg = true;
		}
	}
	if (quote) {
		*error = "unterminated quote in index schema";
		return false;
	}
	if (in_arg) {
		args->push_back(std::move(current));
	}
	return true;
}

}  // namespace Ftsb
