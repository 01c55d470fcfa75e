#include "record.h"

namespace Ftsb {

CmdCategory ParseCategory(const std::string& label) {
	if (label == "SETUP_WRITE") return CmdCategory::kSetupWrite;
	if (label == "WRITE") return CmdCategory::kWrite;
	if (label == "UPDATE") return CmdCategory::kUpdate;
	if (label == "READ") return CmdCategory::kRead;
	if (label == "CURSOR_READ") return CmdCategory::kCursorRead;
	if (label == "DELETE") return CmdCategory::kDelete;
	return CmdCategory::kUnknown;
}

const char* CategoryLabel(CmdCategory category) {
	switch (category) {
		case CmdCategory::kSetupWrite: return "SETUP_WRITE";
		case CmdCategory::kWrite: return "WRITE";
		case CmdCategory::kUpdate: return "UPDATE";
		case CmdCategory::kRead: return "READ";
		case CmdCategory::kCursorRead: return "CURSOR_READ";
		case CmdCategory::kDelete: return "DELETE";
		case CmdCategory::kUnknown: break;
	}
	return "UNKNOWN";
}

}  // namespace Ftsb
