#ifndef KVLOAD_SRC_STORE_STORAGE_CLIENT_H_
#define KVLOAD_SRC_STORE_STORAGE_CLIENT_H_

#include <cstdint>
#include <optional>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "../common/types.h"

namespace KvLoad {

/**
 * Client of the store under test. Each call is atomic for its single key.
 * Implementations must be safe for concurrent use by all workers and handle
 * their own per-operation timeouts.
 */
class StorageClient {
	public:
		virtual ~StorageClient() = default;

		// Upserts the given columns of a row; columns not named are left alone.
		virtual absl::Status Write(int64_t key, const ColumnMap& columns) = 0;

		// std::nullopt when the row does not exist.
		virtual absl::StatusOr<std::optional<ColumnMap>> Read(int64_t key) = 0;
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_STORE_STORAGE_CLIENT_H_
