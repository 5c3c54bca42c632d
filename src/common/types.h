#ifndef KVLOAD_SRC_COMMON_TYPES_H_
#define KVLOAD_SRC_COMMON_TYPES_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace KvLoad {

/**
 * Half-open interval [start, end) of integer keys.
 */
struct KeyRange {
	int64_t start = 0;
	int64_t end = 0;

	int64_t Size() const { return end - start; }
	bool Contains(int64_t key) const { return key >= start && key < end; }
	bool Empty() const { return end <= start; }
};

// Column index -> column payload. Ordered so records compare column by column.
using ColumnMap = std::map<uint32_t, std::string>;

struct GeneratedRecord {
	int64_t key = 0;
	ColumnMap columns;
};

/**
 * Bounds that drive record generation. Writers and readers must agree on
 * these for a reader to regenerate what a writer stored.
 */
struct GeneratorBounds {
	uint32_t min_cols = 1;
	uint32_t max_cols = 1;
	size_t min_size = 1;
	size_t max_size = 1;
};

struct ErrorStats {
	int64_t keys_read = 0;
	int64_t verified = 0;
	int64_t errors = 0;
	int64_t skipped = 0;  // keys the writer failed to write
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_COMMON_TYPES_H_
