#include "key_partitioner.h"

namespace KvLoad {

KeyPartitioner::KeyPartitioner(const KeyRange& range)
	: range_(range), cursor_(range.start) {}

std::optional<int64_t> KeyPartitioner::NextKey() {
	int64_t key = cursor_.load(std::memory_order_relaxed);
	// The cursor never advances past end.
	while (key < range_.end) {
		if (cursor_.compare_exchange_weak(key, key + 1,
					std::memory_order_acq_rel, std::memory_order_relaxed)) {
			return key;
		}
	}
	return std::nullopt;
}

}  // namespace KvLoad
