#ifndef KVLOAD_SRC_LOAD_WRITER_ENGINE_H_
#define KVLOAD_SRC_LOAD_WRITER_ENGINE_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"

#include "../common/types.h"
#include "../common/worker_group.h"
#include "../store/storage_client.h"
#include "key_partitioner.h"
#include "progress_reporter.h"
#include "record_generator.h"
#include "write_progress.h"
#include "write_watermark.h"

namespace KvLoad {

struct WriterOptions {
	// One Write call per key when true, one per column otherwise.
	bool multi_put = false;
	GeneratorBounds bounds;
	// Stop the pool once more than this many keys failed. Negative: never.
	int64_t max_write_errors = -1;
	std::chrono::milliseconds progress_interval{5000};
};

struct WriterStats {
	int64_t keys_written = 0;
	int64_t columns_written = 0;
	int64_t bytes_written = 0;
	int64_t failed_keys = 0;
};

/**
 * Pool of writer workers loading generated records into the store.
 *
 * Workers claim keys from a shared cursor, write the generated record and
 * report the completion to the watermark. A failed write is logged and
 * recorded for that key only; the worker moves on to the next key.
 */
class WriterEngine : public WriteProgressView {
	public:
		static constexpr int64_t kNoWatermark = std::numeric_limits<int64_t>::min();

		explicit WriterEngine(StorageClient* client);
		~WriterEngine() override;

		WriterEngine(const WriterEngine&) = delete;
		WriterEngine& operator=(const WriterEngine&) = delete;

		/**
		 * Must be called before Start.
		 * @throws std::invalid_argument on invalid generation bounds
		 * @throws std::logic_error once the engine has started
		 */
		void Configure(const WriterOptions& options);

		/**
		 * Spawns num_threads writer workers over range.
		 * @throws std::invalid_argument on an empty range or num_threads < 1
		 * @throws std::logic_error when not configured or already started
		 */
		void Start(const KeyRange& range, int num_threads);

		/**
		 * Blocks until every writer worker exited.
		 * @return OK when every key was written, otherwise the first failure
		 */
		absl::Status WaitForFinish();

		// kNoWatermark before Start.
		int64_t Watermark() const override;
		bool Finished() const override;
		bool FailedToWrite(int64_t key) const override;

		WriterStats GetStats() const;
		std::vector<int64_t> FailedKeys() const;

	private:
		void WorkerLoop(int index);
		absl::Status WriteRecord(const GeneratedRecord& record);
		void RecordFailure(int64_t key, const absl::Status& status);

		StorageClient* client_;
		WriterOptions options_;
		bool configured_ = false;

		KeyRange range_;
		std::unique_ptr<RecordGenerator> generator_;
		std::unique_ptr<KeyPartitioner> partitioner_;
		std::unique_ptr<WriteWatermark> watermark_;
		std::unique_ptr<WorkerGroup> workers_;
		std::unique_ptr<ProgressReporter> reporter_;

		std::atomic<bool> started_{false};
		std::atomic<bool> finished_{false};
		std::atomic<bool> stop_requested_{false};
		std::atomic<int> active_workers_{0};

		std::atomic<int64_t> keys_written_{0};
		std::atomic<int64_t> columns_written_{0};
		std::atomic<int64_t> bytes_written_{0};

		mutable absl::Mutex failure_mu_;
		absl::btree_set<int64_t> failed_keys_ ABSL_GUARDED_BY(failure_mu_);
		absl::Status first_error_ ABSL_GUARDED_BY(failure_mu_);
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_LOAD_WRITER_ENGINE_H_
