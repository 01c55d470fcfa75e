#pragma once

#include <memory>
#include <string>
#include <vector>

#include "load/db_creator.h"
#include "redis_client.h"

namespace Ftsb {

/**
 * Manages the RediSearch index a run targets: FT.INFO to detect it,
 * FT.DROPINDEX to remove it and FT.CREATE with the configured schema
 * arguments to create it.
 */
class RediSearchDBCreator : public DBCreator {
public:
	/**
	 * @param index_schema Arguments following "FT.CREATE <index>", e.g.
	 *                     "ON HASH SCHEMA title TEXT price NUMERIC"
	 */
	RediSearchDBCreator(std::string host, std::string index_schema);

	// Connection failure is fatal
	void Init() override;
	bool DBExists(const std::string& db_name) override;
	bool RemoveOldDB(const std::string& db_name, std::string* error) override;
	bool CreateDB(const std::string& db_name, std::string* error) override;
	void Close() override;

	/**
	 * Splits schema arguments on whitespace; single or double quotes keep
	 * spaces inside one argument.
	 * @return false and sets *error on an unterminated quote
	 */
	static bool SplitArguments(const std::string& text, std::vector<std::string>* args, std::string* error);

private:
	std::string host_;
	std::string index_schema_;
	std::unique_ptr<RedisConnection> connection_;

	bool Run(const RedisCommand& command, std::string* error);
};

}  // namespace Ftsb
