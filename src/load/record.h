#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Ftsb {

/**
 * Operation categories a record can belong to. Each one owns a histogram
 * pair in the StatRecorder; kUnknown is counted but not attributed.
 */
enum class CmdCategory : uint8_t {
	kSetupWrite = 0,
	kWrite,
	kUpdate,
	kRead,
	kCursorRead,
	kDelete,
	kUnknown,
};

constexpr size_t kNumCategories = 6;

constexpr std::array<CmdCategory, kNumCategories> kAllCategories = {
	CmdCategory::kSetupWrite, CmdCategory::kWrite, CmdCategory::kUpdate,
	CmdCategory::kRead, CmdCategory::kCursorRead, CmdCategory::kDelete,
};

/// Maps an input label ("SETUP_WRITE", "WRITE", ...) to its category.
CmdCategory ParseCategory(const std::string& label);

/// Input label of a category; "UNKNOWN" for kUnknown.
const char* CategoryLabel(CmdCategory category);

/**
 * One command read from the input stream. Immutable once decoded.
 */
struct Record {
	CmdCategory category = CmdCategory::kUnknown;
	std::string label;
	std::string id;
	std::string command;
	std::vector<std::string> args;
	// Size of the serialized line minus the category label
	uint64_t tx_bytes = 0;
};

}  // namespace Ftsb
