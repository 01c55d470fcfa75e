#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "record.h"

namespace Ftsb {

/**
 * Observation for one dispatched command.
 */
struct CmdStat {
	CmdCategory category = CmdCategory::kUnknown;
	std::string id;
	uint64_t latency_us = 0;
	uint64_t tx_bytes = 0;
	uint64_t rx_bytes = 0;
	bool is_update = false;
	bool is_delete = false;
};

/**
 * CmdStats produced by one ProcessBatch() call.
 */
class Stat {
public:
	Stat& AddEntry(CmdCategory category, std::string id, uint64_t latency_us,
			bool is_update, bool is_delete, uint64_t tx_bytes, uint64_t rx_bytes) {
		cmd_stats_.push_back(CmdStat{category, std::move(id), latency_us, tx_bytes, rx_bytes,
				is_update, is_delete});
		return *this;
	}

	void Add(CmdStat&& stat) { cmd_stats_.push_back(std::move(stat)); }

	void Merge(Stat&& other) {
		cmd_stats_.insert(cmd_stats_.end(),
				std::make_move_iterator(other.cmd_stats_.begin()),
				std::make_move_iterator(other.cmd_stats_.end()));
		other.cmd_stats_.clear();
	}

	const std::vector<CmdStat>& CmdStats() const { return cmd_stats_; }
	size_t Size() const { return cmd_stats_.size(); }
	bool Empty() const { return cmd_stats_.empty(); }

private:
	std::vector<CmdStat> cmd_stats_;
};

}  // namespace Ftsb
