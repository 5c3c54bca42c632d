#ifndef KVLOAD_SRC_LOAD_WRITE_PROGRESS_H_
#define KVLOAD_SRC_LOAD_WRITE_PROGRESS_H_

#include <cstdint>

namespace KvLoad {

/**
 * Read-only view of a writer's progress handed to a linked reader.
 * All methods are safe to call from any thread at any time, including
 * before the writer starts and after it finishes.
 */
class WriteProgressView {
	public:
		virtual ~WriteProgressView() = default;

		// Every key in [range start, Watermark()] has been written.
		virtual int64_t Watermark() const = 0;

		// True once all writer workers exited; no key changes state afterwards.
		virtual bool Finished() const = 0;

		virtual bool FailedToWrite(int64_t key) const = 0;
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_LOAD_WRITE_PROGRESS_H_
