#ifndef KVLOAD_SRC_TOOL_TOOL_OPTIONS_H_
#define KVLOAD_SRC_TOOL_TOOL_OPTIONS_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../common/configuration.h"
#include "../common/types.h"
#include "../load/load_test_driver.h"

namespace KvLoad {

// --write <avg_cols_per_key>:<avg_data_size>[:<#threads>]
struct WriteArgs {
	int avg_columns = 0;
	size_t avg_data_size = 0;
	std::optional<int> threads;
};

// --read <verify_percent>[:<#threads>]
struct ReadArgs {
	int verify_percent = 0;
	std::optional<int> threads;
};

/**
 * Splits a colon separated option value.
 * @throws std::invalid_argument unless it has between min_parts and max_parts parts
 */
std::vector<std::string> SplitColonSeparated(const std::string& option, const std::string& value,
		size_t min_parts, size_t max_parts);

WriteArgs ParseWriteArgs(const std::string& value);
ReadArgs ParseReadArgs(const std::string& value);

// Enables the pool and overrides its settings with the command line values.
void ApplyWriteArgs(const WriteArgs& args, KvLoadConfig& config);
void ApplyReadArgs(const ReadArgs& args, KvLoadConfig& config);

// Columns in [1, 2 * avg_columns], sizes in [avg_data_size / 2, avg_data_size * 3 / 2].
// Averages are expected within [1, kMaxGenerationAverage], as validate() enforces.
GeneratorBounds BoundsFromAverages(int avg_columns, size_t avg_data_size);

// Translates a validated configuration into driver options.
LoadTestOptions BuildLoadTestOptions(const KvLoadConfig& config);

}  // namespace KvLoad

#endif  // KVLOAD_SRC_TOOL_TOOL_OPTIONS_H_
