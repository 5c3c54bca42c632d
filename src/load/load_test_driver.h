#ifndef KVLOAD_SRC_LOAD_LOAD_TEST_DRIVER_H_
#define KVLOAD_SRC_LOAD_LOAD_TEST_DRIVER_H_

#include <cstdint>

#include "absl/status/status.h"

#include "../common/types.h"
#include "../store/storage_client.h"
#include "reader_engine.h"
#include "writer_engine.h"

namespace KvLoad {

struct LoadTestOptions {
	KeyRange range;
	bool write = false;
	bool read = false;
	int writer_threads = 20;
	int reader_threads = 20;
	WriterOptions writer;
	// When writing too, reader.bounds is replaced by writer.bounds.
	ReaderOptions reader;
};

struct LoadTestReport {
	bool wrote = false;
	bool read = false;
	absl::Status write_status;
	WriterStats writer_stats;
	int64_t watermark = WriterEngine::kNoWatermark;
	ReadResult read_result;

	// No failed write, no read error and no abort.
	bool Succeeded() const;
};

/**
 * Runs a write pass, a read pass, or both concurrently with the readers
 * linked to the writer's progress.
 */
class LoadTestDriver {
	public:
		explicit LoadTestDriver(StorageClient* client);

		/**
		 * Validates the range, the thread counts and both engine configurations
		 * before any worker starts.
		 * @throws std::invalid_argument when neither write nor read is requested
		 *         or when any of those is invalid
		 */
		LoadTestReport Run(const LoadTestOptions& options);

	private:
		StorageClient* client_;
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_LOAD_LOAD_TEST_DRIVER_H_
