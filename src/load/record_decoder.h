#pragma once

#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "record.h"

namespace Ftsb {

/**
 * Produces records from an input stream, one at a time.
 */
class RecordDecoder {
public:
	virtual ~RecordDecoder() = default;

	/**
	 * Decodes the next well-formed record into *out.
	 * Malformed lines are skipped and counted.
	 * @return false once the input is exhausted
	 */
	virtual bool Decode(Record* out) = 0;

	virtual uint64_t MalformedCount() const = 0;
};

/**
 * Owns the stream records are read from: a file, or standard input when no
 * file name is given. Opening failure is fatal.
 */
class InputSource {
public:
	explicit InputSource(const std::string& file_name);
	~InputSource();

	InputSource(const InputSource&) = delete;
	InputSource& operator=(const InputSource&) = delete;

	std::istream& stream() { return *in_; }
	const std::string& name() const { return name_; }

private:
	std::string name_;
	std::unique_ptr<char[]> read_buffer_;
	std::ifstream file_;
	std::istream* in_;
};

/**
 * Decodes newline-delimited CSV lines of the form
 *   category,identifier,command[,arg...]
 * Fields follow RFC 4180 quoting ("a,b" and "" escapes).
 */
class CsvRecordDecoder : public RecordDecoder {
public:
	explicit CsvRecordDecoder(std::istream& in) : in_(in) {}

	bool Decode(Record* out) override;
	uint64_t MalformedCount() const override { return malformed_; }

	/**
	 * Splits one CSV line into fields.
	 * @return false and sets *error when quoting is broken
	 */
	static bool SplitFields(const std::string& line, std::vector<std::string>* fields, std::string* error);

	/**
	 * Parses one line into a record.
	 * @return false and sets *error when the line is malformed
	 */
	static bool ParseLine(const std::string& line, Record* out, std::string* error);

private:
	std::istream& in_;
	std::string line_;
	uint64_t line_number_ = 0;
	uint64_t malformed_ = 0;
};

}  // namespace Ftsb
