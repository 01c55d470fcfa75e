#pragma once

#include <string>

namespace Ftsb {

/**
 * Lifecycle of the database (index) a benchmark targets. Failures of
 * RemoveOldDB/CreateDB are reported through the return value and treated as
 * fatal by the runner.
 */
class DBCreator {
public:
	virtual ~DBCreator() = default;

	// Opens whatever session the other calls need
	virtual void Init() = 0;

	virtual bool DBExists(const std::string& db_name) = 0;

	virtual bool RemoveOldDB(const std::string& db_name, std::string* error) = 0;

	virtual bool CreateDB(const std::string& db_name, std::string* error) = 0;

	// Runs after a successful CreateDB
	virtual void PostCreateDB(const std::string& db_name) { (void)db_name; }

	// Deferred cleanup, run once when the benchmark finishes
	virtual void Close() {}
};

}  // namespace Ftsb
