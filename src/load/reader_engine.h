#ifndef KVLOAD_SRC_LOAD_READER_ENGINE_H_
#define KVLOAD_SRC_LOAD_READER_ENGINE_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "absl/container/btree_set.h"
#include "absl/synchronization/mutex.h"

#include "../common/types.h"
#include "../common/worker_group.h"
#include "../store/storage_client.h"
#include "key_partitioner.h"
#include "progress_reporter.h"
#include "record_generator.h"
#include "write_progress.h"

namespace KvLoad {

struct ReaderOptions {
	// Probability, in percent, that a read key is compared with its expected record.
	int verify_percent = 100;
	// Readers abort once the error count exceeds this.
	int64_t max_errors = 10;
	// Minimum lag behind a linked writer's watermark, in keys.
	int64_t key_window = 0;
	// Must match the bounds the data was written with.
	GeneratorBounds bounds;
	// Seeds the per-worker verify sampling.
	uint64_t seed = 0;
	std::chrono::milliseconds min_backoff{1};
	std::chrono::milliseconds max_backoff{100};
	std::chrono::milliseconds progress_interval{5000};
};

enum class ReadOutcome {
	kCompleted,  // range exhausted, errors at or below the threshold
	kAborted,    // error threshold exceeded, readers stopped early
};

struct ReadResult {
	ErrorStats stats;
	ReadOutcome outcome = ReadOutcome::kCompleted;
	// Keys that failed verification or could not be read, ascending.
	std::vector<int64_t> error_keys;

	bool aborted() const { return outcome == ReadOutcome::kAborted; }
};

/**
 * Pool of reader workers verifying what a writer stored.
 *
 * Each worker claims the next key, waits (with backoff) until a linked
 * writer's watermark is at least key_window keys past it, reads the row and,
 * with probability verify_percent/100, compares it with the regenerated
 * record. Read failures, missing rows and mismatches all count as errors;
 * once errors exceed max_errors every worker stops claiming keys.
 */
class ReaderEngine {
	public:
		explicit ReaderEngine(StorageClient* client);
		~ReaderEngine();

		ReaderEngine(const ReaderEngine&) = delete;
		ReaderEngine& operator=(const ReaderEngine&) = delete;

		/**
		 * @throws std::invalid_argument on verify_percent outside [0, 100],
		 *         negative max_errors or key_window, invalid bounds or backoff
		 * @throws std::logic_error once the engine has started
		 */
		void Configure(const ReaderOptions& options);

		/**
		 * Makes readers trail the writer's watermark. Optional; without a link
		 * the whole range is readable immediately.
		 * @throws std::logic_error once the engine has started
		 */
		void LinkToWriter(const WriteProgressView* writer);

		/**
		 * @throws std::invalid_argument on an empty range or num_threads < 1
		 * @throws std::logic_error when not configured or already started
		 */
		void Start(const KeyRange& range, int num_threads);

		// Blocks until every reader exited, either range exhausted or aborted.
		ReadResult WaitForFinish();

		ErrorStats GetStats() const;
		bool Aborted() const { return aborted_.load(std::memory_order_acquire); }

	private:
		void WorkerLoop(int index);
		bool WaitUntilReadable(int64_t key);
		int64_t MaxReadableKey() const;
		void ReadKey(int64_t key, bool verify);
		void RecordError(int64_t key);

		StorageClient* client_;
		const WriteProgressView* writer_ = nullptr;
		ReaderOptions options_;
		bool configured_ = false;

		KeyRange range_;
		std::unique_ptr<RecordGenerator> generator_;
		std::unique_ptr<KeyPartitioner> partitioner_;
		std::unique_ptr<WorkerGroup> workers_;
		std::unique_ptr<ProgressReporter> reporter_;

		std::atomic<bool> started_{false};
		std::atomic<bool> aborted_{false};

		std::atomic<int64_t> keys_read_{0};
		std::atomic<int64_t> verified_{0};
		std::atomic<int64_t> errors_{0};
		std::atomic<int64_t> skipped_{0};

		mutable absl::Mutex error_mu_;
		absl::btree_set<int64_t> error_keys_ ABSL_GUARDED_BY(error_mu_);
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_LOAD_READER_ENGINE_H_
