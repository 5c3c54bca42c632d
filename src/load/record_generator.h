#ifndef KVLOAD_SRC_LOAD_RECORD_GENERATOR_H_
#define KVLOAD_SRC_LOAD_RECORD_GENERATOR_H_

#include <cstdint>
#include <optional>
#include <string>

#include "../common/types.h"

namespace KvLoad {

/**
 * Deterministic record generator.
 *
 * The record for a key is a pure function of the key and the bounds: the
 * column count is drawn from [min_cols, max_cols] and every column size from
 * [min_size, max_size] using a generator seeded only by the key (and the
 * column index for payloads). A reader in another process regenerates the
 * same bytes without any side channel.
 *
 * Payloads start with "<key>:<column>:" (truncated when the column is
 * shorter) so a misplaced value is easy to identify in a failure log.
 */
class RecordGenerator {
	public:
		/**
		 * @param bounds Generation bounds; must pass ValidateBounds
		 * @throws std::invalid_argument on invalid bounds
		 */
		explicit RecordGenerator(const GeneratorBounds& bounds);

		/**
		 * Throws std::invalid_argument when min > max for columns or sizes or
		 * when min_cols is 0.
		 */
		static void ValidateBounds(const GeneratorBounds& bounds);

		GeneratedRecord Generate(int64_t key) const;

		uint32_t ColumnCount(int64_t key) const;
		std::string GenerateColumn(int64_t key, uint32_t column) const;

		const GeneratorBounds& bounds() const { return bounds_; }

	private:
		GeneratorBounds bounds_;
};

/**
 * Compares a stored row against the expected record column by column.
 * @return std::nullopt when identical, otherwise a description of the first
 *         missing, extra or differing column
 */
std::optional<std::string> DescribeMismatch(const ColumnMap& expected, const ColumnMap& actual);

}  // namespace KvLoad

#endif  // KVLOAD_SRC_LOAD_RECORD_GENERATOR_H_
