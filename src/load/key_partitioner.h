#ifndef KVLOAD_SRC_LOAD_KEY_PARTITIONER_H_
#define KVLOAD_SRC_LOAD_KEY_PARTITIONER_H_

#include <atomic>
#include <cstdint>
#include <optional>

#include "../common/types.h"

namespace KvLoad {

/**
 * Hands out the keys of a range to any number of workers through one shared
 * cursor. Claims are strictly increasing and never overlap; once the range is
 * exhausted every call returns std::nullopt. Faster workers simply claim more.
 */
class KeyPartitioner {
	public:
		explicit KeyPartitioner(const KeyRange& range);

		KeyPartitioner(const KeyPartitioner&) = delete;
		KeyPartitioner& operator=(const KeyPartitioner&) = delete;

		std::optional<int64_t> NextKey();

	private:
		const KeyRange range_;
		std::atomic<int64_t> cursor_;
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_LOAD_KEY_PARTITIONER_H_
