#include "write_watermark.h"

#include <glog/logging.h>

namespace KvLoad {

WriteWatermark::WriteWatermark(int64_t start)
	: next_expected_(start), watermark_(start - 1) {}

int64_t WriteWatermark::MarkCompleted(int64_t key) {
	absl::MutexLock lock(&mu_);
	if (key < next_expected_) {
		VLOG(2) << "Key #" << key << " completed again below watermark " << next_expected_ - 1;
		return next_expected_ - 1;
	}
	if (key != next_expected_) {
		completed_above_.insert(key);
		return next_expected_ - 1;
	}

	++next_expected_;
	auto it = completed_above_.begin();
	while (it != completed_above_.end() && *it == next_expected_) {
		++next_expected_;
		it = completed_above_.erase(it);
	}
	watermark_.store(next_expected_ - 1, std::memory_order_release);
	return next_expected_ - 1;
}

size_t WriteWatermark::PendingCount() const {
	absl::MutexLock lock(&mu_);
	return completed_above_.size();
}

}  // namespace KvLoad
