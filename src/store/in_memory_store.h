#ifndef KVLOAD_SRC_STORE_IN_MEMORY_STORE_H_
#define KVLOAD_SRC_STORE_IN_MEMORY_STORE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

#include "storage_client.h"

namespace KvLoad {

struct InMemoryStoreOptions {
	// Rounded up to a power of two.
	size_t num_shards = 16;
	// Each operation sleeps for a random duration in [0, max_op_delay_us].
	uint32_t max_op_delay_us = 0;
};

/**
 * Ordered, sharded in-memory implementation of StorageClient. Keys are
 * spread over shards by key stride so neighbouring keys land on different
 * locks; each shard keeps its rows sorted.
 */
class InMemoryStore : public StorageClient {
	private:
		struct Shard {
			absl::btree_map<int64_t, ColumnMap> rows;
			mutable std::shared_mutex mutex;

			Shard() = default;

			// Prevent copying and moving
			Shard(const Shard&) = delete;
			Shard& operator=(const Shard&) = delete;
		};

		std::vector<std::unique_ptr<Shard>> shards_;
		size_t shard_mask_;
		uint32_t max_op_delay_us_;

		Shard& ShardFor(int64_t key) const {
			return *shards_[static_cast<uint64_t>(key) & shard_mask_];
		}

		void SimulateLatency() const;

	public:
		explicit InMemoryStore(const InMemoryStoreOptions& options = InMemoryStoreOptions());

		InMemoryStore(const InMemoryStore&) = delete;
		InMemoryStore& operator=(const InMemoryStore&) = delete;

		absl::Status Write(int64_t key, const ColumnMap& columns) override;
		absl::StatusOr<std::optional<ColumnMap>> Read(int64_t key) override;

		// Overwrites one column of a stored row, bypassing the client path.
		// Returns false when the row does not exist.
		bool Corrupt(int64_t key, uint32_t column, const std::string& value);

		bool Remove(int64_t key);

		bool Contains(int64_t key) const;

		// Rows with keys in [start, end), in key order.
		std::vector<int64_t> KeysInRange(int64_t start, int64_t end) const;

		// Get total number of rows across all shards
		size_t size() const;

		void clear();
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_STORE_IN_MEMORY_STORE_H_
