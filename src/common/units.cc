#include "units.h"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Ftsb {

std::string FormatByteSize(uint64_t bytes) {
	static const char* kUnits[] = {"B", "K", "M", "G", "T", "P", "E"};
	if (bytes == 0) {
		return "0B";
	}
	double value = static_cast<double>(bytes);
	size_t unit = 0;
	while (value >= 1024.0 && unit < 6) {
		value /= 1024.0;
		++unit;
	}
	std::ostringstream out;
	out << std::fixed << std::setprecision(1) << value;
	std::string result = out.str();
	if (result.size() > 2 && result.compare(result.size() - 2, 2, ".0") == 0) {
		result.erase(result.size() - 2);
	}
	return result + kUnits[unit];
}

std::chrono::nanoseconds ParseDuration(const std::string& text) {
	if (text.empty()) {
		throw std::invalid_argument("empty duration");
	}
	if (text == "0") {
		return std::chrono::nanoseconds(0);
	}

	double total_ns = 0;
	size_t pos = 0;
	while (pos < text.size()) {
		size_t start = pos;
		while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
			++pos;
		}
		if (start == pos) {
			throw std::invalid_argument("invalid duration: " + text);
		}
		std::string number = text.substr(start, pos - start);
		size_t parsed = 0;
		double value = std::stod(number, &parsed);
		if (parsed != number.size()) {
			throw std::invalid_argument("invalid number \"" + number + "\" in duration " + text);
		}

		size_t unit_start = pos;
		while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
			++pos;
		}
		std::string unit = text.substr(unit_start, pos - unit_start);
		double scale;
		if (unit == "ns") scale = 1;
		else if (unit == "us") scale = 1e3;
		else if (unit == "ms") scale = 1e6;
		else if (unit == "s") scale = 1e9;
		else if (unit == "m") scale = 60e9;
		else if (unit == "h") scale = 3600e9;
		else throw std::invalid_argument("unknown unit \"" + unit + "\" in duration " + text);

		total_ns += value * scale;
	}
	return std::chrono::nanoseconds(static_cast<int64_t>(std::llround(total_ns)));
}

std::string FormatDuration(std::chrono::nanoseconds d) {
	int64_t ns = d.count();
	if (ns == 0) return "0";
	if (ns % 1000000000 == 0) return std::to_string(ns / 1000000000) + "s";
	if (ns % 1000000 == 0) return std::to_string(ns / 1000000) + "ms";
	if (ns % 1000 == 0) return std::to_string(ns / 1000) + "us";
	return std::to_string(ns) + "ns";
}

}  // namespace Ftsb
