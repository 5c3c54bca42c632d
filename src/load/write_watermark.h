#ifndef KVLOAD_SRC_LOAD_WRITE_WATERMARK_H_
#define KVLOAD_SRC_LOAD_WRITE_WATERMARK_H_

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "absl/container/btree_set.h"
#include "absl/synchronization/mutex.h"

namespace KvLoad {

/**
 * Tracks the high end of the contiguous prefix of completed keys.
 *
 * Keys complete in any order. A completion equal to the next expected key
 * advances the boundary and then drains every already-completed key that
 * extends the prefix; any other completion is parked until the gap below it
 * closes. Value() is start - 1 until the first key of the range completes.
 */
class WriteWatermark {
	public:
		explicit WriteWatermark(int64_t start);

		WriteWatermark(const WriteWatermark&) = delete;
		WriteWatermark& operator=(const WriteWatermark&) = delete;

		/**
		 * Registers a completed key.
		 * @return the watermark after this completion
		 */
		int64_t MarkCompleted(int64_t key);

		// Largest W such that every key in [start, W] completed. Lock free.
		int64_t Value() const { return watermark_.load(std::memory_order_acquire); }

		// Completed keys still waiting for a gap below them to close.
		size_t PendingCount() const;

	private:
		mutable absl::Mutex mu_;
		int64_t next_expected_ ABSL_GUARDED_BY(mu_);
		absl::btree_set<int64_t> completed_above_ ABSL_GUARDED_BY(mu_);
		std::atomic<int64_t> watermark_;
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_LOAD_WRITE_WATERMARK_H_
