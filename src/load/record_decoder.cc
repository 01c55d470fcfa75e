#include "record_decoder.h"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <glog/logging.h>

#include "common/config.h"

namespace Ftsb {

InputSource::InputSource(const std::string& file_name)
	: name_(file_name.empty() ? "<stdin>" : file_name),
	  in_(&std::cin) {
	// std::cin keeps its own buffer; only the file gets the large one
	if (file_name.empty()) {
		return;
	}
	read_buffer_.reset(new char[kDefaultReadSize]);
	file_.rdbuf()->pubsetbuf(read_buffer_.get(), kDefaultReadSize);
	file_.open(file_name, std::ios::in | std::ios::binary);
	if (!file_.is_open()) {
		LOG(FATAL) << "cannot open file for read " << file_name << ": " << strerror(errno);
	}
	in_ = &file_;
}

InputSource::~InputSource() {
	if (file_.is_open()) {
		file_.close();
	}
}

bool CsvRecordDecoder::SplitFields(const std::string& line, std::vector<std::string>* fields,
		std::string* error) {
	fields->clear();
	std::string field;
	size_t i = 0;
	const size_t n = line.size();

	while (true) {
		field.clear();
		if (i < n && line[i] == '"') {
			// Quoted field
			++i;
			bool closed = false;
			while (i < n) {
				char c = line[i];
				if (c == '"') {
					if (i + 1 < n && line[i + 1] == '"') {
						field.push_back('"');
						i += 2;
						continue;
					}
					closed = true;
					++i;
					break;
				}
				field.push_back(c);
				++i;
			}
			if (!closed) {
				*error = "extraneous or missing \" in quoted-field";
				return false;
			}
			if (i < n && line[i] != ',') {
				*error = "extraneous \" in field";
				return false;
			}
		} else {
			while (i < n && line[i] != ',') {
				if (line[i] == '"') {
					*error = "bare \" in non-quoted-field";
					return false;
				}
				field.push_back(line[i]);
				++i;
			}
		}
		fields->push_back(field);
		if (i >= n) {
			break;
		}
		// Skip the comma
		++i;
	}
	return true;
}

bool CsvRecordDecoder::ParseLine(const std::string& line, Record* out, std::string* error) {
	std::vector<std::string> fields;
	if (!SplitFields(line, &fields, error)) {
		return false;
	}
	// category, identifier and command are mandatory
	if (fields.size() < 3) {
		*error = "input string does not have the minimum required size of 3 fields: " + line;
		return false;
	}

	out->label = fields[0];
	out->category = ParseCategory(fields[0]);
	out->id = fields[1];
	out->command = fields[2];
	out->args.assign(std::make_move_iterator(fields.begin() + 3), std::make_move_iterator(fields.end()));
	out->tx_bytes = static_cast<uint64_t>(line.size() - out->label.size());
	return true;
}

bool CsvRecordDecoder::Decode(Record* out) {
	std::string error;
	while (std::getline(in_, line_)) {
		++line_number_;
		if (!line_.empty() && line_.back() == '\r') {
			line_.pop_back();
		}
		if (line_.empty()) {
			continue;
		}
		if (ParseLine(line_, out, &error)) {
			return true;
		}
		++malformed_;
		LOG_EVERY_N(WARNING, 1000) << "Skipping malformed record at line " << line_number_
			<< ": " << error << " (" << google::COUNTER << " so far)";
	}
	if (in_.bad()) {
		LOG(FATAL) << "Error reading input at line " << line_number_ << ": " << strerror(errno);
	}
	return false;
}

}  // namespace Ftsb
