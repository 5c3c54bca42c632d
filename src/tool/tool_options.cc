#include "tool_options.h"

#include <chrono>
#include <cstdint>
#include <stdexcept>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace KvLoad {

namespace {

constexpr int kMaxThreads = 32767;

int ParseInt(const std::string& option, const std::string& text, int64_t min, int64_t max) {
	int64_t value = 0;
	if (!absl::SimpleAtoi(text, &value) || value < min || value > max) {
		throw std::invalid_argument(absl::StrCat("Invalid value '", text, "' in the -", option,
					" option, expected an integer in [", min, ", ", max, "]"));
	}
	return static_cast<int>(value);
}

}  // namespace

std::vector<std::string> SplitColonSeparated(const std::string& option, const std::string& value,
		size_t min_parts, size_t max_parts) {
	std::vector<std::string> parts = absl::StrSplit(value, ':');
	if (parts.size() < min_parts || parts.size() > max_parts) {
		throw std::invalid_argument(absl::StrCat("Expected at least ", min_parts,
					" columns but no more than ", max_parts, " in the colon-separated value '",
					value, "' of the -", option, " option"));
	}
	return parts;
}

WriteArgs ParseWriteArgs(const std::string& value) {
	std::vector<std::string> parts = SplitColonSeparated("write", value, 2, 3);
	WriteArgs args;
	args.avg_columns = ParseInt("write", parts[0], 1, kMaxGenerationAverage);
	args.avg_data_size = static_cast<size_t>(ParseInt("write", parts[1], 1, kMaxGenerationAverage));
	if (parts.size() > 2) {
		args.threads = ParseInt("write", parts[2], 1, kMaxThreads);
	}
	return args;
}

ReadArgs ParseReadArgs(const std::string& value) {
	std::vector<std::string> parts = SplitColonSeparated("read", value, 1, 2);
	ReadArgs args;
	args.verify_percent = ParseInt("read", parts[0], 0, 100);
	if (parts.size() > 1) {
		args.threads = ParseInt("read", parts[1], 1, kMaxThreads);
	}
	return args;
}

void ApplyWriteArgs(const WriteArgs& args, KvLoadConfig& config) {
	config.writer.enabled.setOverride(true);
	config.writer.avg_columns.setOverride(args.avg_columns);
	config.writer.avg_data_size.setOverride(args.avg_data_size);
	if (args.threads) {
		config.writer.threads.setOverride(*args.threads);
	}
}

void ApplyReadArgs(const ReadArgs& args, KvLoadConfig& config) {
	config.reader.enabled.setOverride(true);
	config.reader.verify_percent.setOverride(args.verify_percent);
	if (args.threads) {
		config.reader.threads.setOverride(*args.threads);
	}
}

GeneratorBounds BoundsFromAverages(int avg_columns, size_t avg_data_size) {
	GeneratorBounds bounds;
	bounds.min_cols = 1;
	bounds.max_cols = static_cast<uint32_t>(2 * static_cast<uint64_t>(avg_columns));
	bounds.min_size = static_cast<size_t>(static_cast<uint64_t>(avg_data_size) / 2);
	bounds.max_size = static_cast<size_t>(static_cast<uint64_t>(avg_data_size) * 3 / 2);
	return bounds;
}

LoadTestOptions BuildLoadTestOptions(const KvLoadConfig& config) {
	LoadTestOptions options;
	options.range.start = config.workload.start_key.get();
	options.range.end = options.range.start + config.workload.num_keys.get();
	options.write = config.writer.enabled.get();
	options.read = config.reader.enabled.get();
	options.writer_threads = config.writer.threads.get();
	options.reader_threads = config.reader.threads.get();

	const std::chrono::milliseconds progress_interval(config.reporting.progress_interval_ms.get());
	const GeneratorBounds bounds =
		BoundsFromAverages(config.writer.avg_columns.get(), config.writer.avg_data_size.get());

	options.writer.multi_put = config.writer.multi_put.get();
	options.writer.bounds = bounds;
	options.writer.max_write_errors = config.writer.max_write_errors.get();
	options.writer.progress_interval = progress_interval;

	options.reader.verify_percent = config.reader.verify_percent.get();
	options.reader.max_errors = config.reader.max_read_errors.get();
	options.reader.key_window = config.reader.key_window.get();
	options.reader.bounds = bounds;
	options.reader.seed = config.reader.seed.get();
	options.reader.min_backoff = std::chrono::milliseconds(config.coordination.min_backoff_ms.get());
	options.reader.max_backoff = std::chrono::milliseconds(config.coordination.max_backoff_ms.get());
	options.reader.progress_interval = progress_interval;
	return options;
}

}  // namespace KvLoad
