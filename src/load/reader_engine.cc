#include "reader_engine.h"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"

namespace KvLoad {

ReaderEngine::ReaderEngine(StorageClient* client) : client_(client) {
	if (client_ == nullptr) {
		throw std::invalid_argument("ReaderEngine requires a storage client");
	}
}

ReaderEngine::~ReaderEngine() {
	if (workers_) {
		aborted_.store(true);
		workers_->Join();
	}
	if (reporter_) {
		reporter_->Stop();
	}
}

void ReaderEngine::Configure(const ReaderOptions& options) {
	if (started_.load()) {
		throw std::logic_error("ReaderEngine::Configure called after Start");
	}
	if (options.verify_percent < 0 || options.verify_percent > 100) {
		throw std::invalid_argument("verify_percent must be in [0, 100], got " +
				std::to_string(options.verify_percent));
	}
	if (options.max_errors < 0) {
		throw std::invalid_argument("max_errors must not be negative");
	}
	if (options.key_window < 0) {
		throw std::invalid_argument("key_window must not be negative");
	}
	if (options.min_backoff.count() < 1 || options.max_backoff < options.min_backoff) {
		throw std::invalid_argument("watermark backoff must satisfy 1ms <= min <= max");
	}
	RecordGenerator::ValidateBounds(options.bounds);
	options_ = options;
	configured_ = true;
	LOG(INFO) << "Reader configured: percent of keys to verify=" << options_.verify_percent
		<< " max read errors=" << options_.max_errors
		<< " key window=" << options_.key_window;
}

void ReaderEngine::LinkToWriter(const WriteProgressView* writer) {
	if (started_.load()) {
		throw std::logic_error("ReaderEngine::LinkToWriter called after Start");
	}
	writer_ = writer;
	LOG(INFO) << "Readers will trail the writer's insertion point by " << options_.key_window
		<< " keys";
}

void ReaderEngine::Start(const KeyRange& range, int num_threads) {
	if (!configured_) {
		throw std::logic_error("ReaderEngine::Start called before Configure");
	}
	if (started_.load()) {
		throw std::logic_error("ReaderEngine already started");
	}
	if (range.Empty()) {
		throw std::invalid_argument("Empty key range [" + std::to_string(range.start) + ", " +
				std::to_string(range.end) + ")");
	}
	if (num_threads < 1) {
		throw std::invalid_argument("Reader thread count must be at least 1, got " +
				std::to_string(num_threads));
	}

	range_ = range;
	generator_ = std::make_unique<RecordGenerator>(options_.bounds);
	partitioner_ = std::make_unique<KeyPartitioner>(range_);
	workers_ = std::make_unique<WorkerGroup>("reader");
	started_.store(true, std::memory_order_release);

	reporter_ = std::make_unique<ProgressReporter>("reader", range_.Size(), options_.progress_interval,
			[this]() { return keys_read_.load() + skipped_.load(); },
			[this]() {
				return absl::StrCat("verified: ", verified_.load(), ", read errors: ", errors_.load());
			});
	reporter_->Start();

	LOG(INFO) << "Starting " << num_threads << " reader threads for keys "
		<< range_.start << ".." << range_.end - 1;
	workers_->Start(num_threads, [this](int index) { WorkerLoop(index); });
}

void ReaderEngine::WorkerLoop(int index) {
	VLOG(1) << "Reader thread " << index << " started";
	std::mt19937_64 rng(options_.seed + static_cast<uint64_t>(index));
	std::uniform_int_distribution<int> percent(0, 99);

	while (!aborted_.load(std::memory_order_acquire)) {
		std::optional<int64_t> key = partitioner_->NextKey();
		if (!key) {
			break;
		}
		if (!WaitUntilReadable(*key)) {
			break;
		}
		if (writer_ != nullptr && writer_->FailedToWrite(*key)) {
			VLOG(1) << "Reader " << index << " skipping key #" << *key << " the writer failed to write";
			skipped_.fetch_add(1, std::memory_order_relaxed);
			continue;
		}
		const bool verify = percent(rng) < options_.verify_percent;
		ReadKey(*key, verify);
	}
	VLOG(1) << "Reader thread " << index << " finished";
}

int64_t ReaderEngine::MaxReadableKey() const {
	const int64_t last_key = range_.end - 1;
	if (writer_ == nullptr) {
		return last_key;
	}
	// Once the writer is done every key is final, including the window at the tail.
	if (writer_->Finished()) {
		return last_key;
	}
	const int64_t watermark = writer_->Watermark();
	if (watermark >= last_key) {
		return last_key;
	}
	if (watermark < range_.start) {
		return range_.start - 1;
	}
	return std::min(last_key, watermark - options_.key_window);
}

bool ReaderEngine::WaitUntilReadable(int64_t key) {
	auto backoff = options_.min_backoff;
	while (key > MaxReadableKey()) {
		if (aborted_.load(std::memory_order_acquire)) {
			return false;
		}
		VLOG(3) << "Key #" << key << " not readable yet, writer insertion point "
			<< writer_->Watermark();
		std::this_thread::sleep_for(backoff);
		backoff = std::min(backoff * 2, options_.max_backoff);
	}
	return true;
}

void ReaderEngine::ReadKey(int64_t key, bool verify) {
	keys_read_.fetch_add(1, std::memory_order_relaxed);

	absl::StatusOr<std::optional<ColumnMap>> result;
	try {
		result = client_->Read(key);
	} catch (const std::exception& e) {
		result = absl::InternalError(absl::StrCat("storage client threw: ", e.what()));
	}

	if (!result.ok()) {
		LOG(ERROR) << "Failed to read key #" << key << ": " << result.status();
		RecordError(key);
		return;
	}
	if (!result->has_value()) {
		LOG(ERROR) << "No data returned for key #" << key;
		RecordError(key);
		return;
	}
	if (!verify) {
		return;
	}

	verified_.fetch_add(1, std::memory_order_relaxed);
	GeneratedRecord expected = generator_->Generate(key);
	std::optional<std::string> mismatch = DescribeMismatch(expected.columns, **result);
	if (mismatch) {
		LOG(ERROR) << "Verification failed for key #" << key << ": " << *mismatch;
		RecordError(key);
		return;
	}
	VLOG(3) << "Verified key #" << key << " (" << expected.columns.size() << " columns)";
}

void ReaderEngine::RecordError(int64_t key) {
	{
		absl::MutexLock lock(&error_mu_);
		error_keys_.insert(key);
	}
	const int64_t errors = errors_.fetch_add(1, std::memory_order_acq_rel) + 1;
	if (errors > options_.max_errors && !aborted_.exchange(true)) {
		LOG(ERROR) << "Exceeded the maximum number of read errors (" << options_.max_errors
			<< "), aborting all readers";
	}
}

ReadResult ReaderEngine::WaitForFinish() {
	if (!started_.load()) {
		throw std::logic_error("ReaderEngine::WaitForFinish called before Start");
	}
	workers_->Join();
	reporter_->Stop();

	ReadResult result;
	result.stats = GetStats();
	result.outcome = Aborted() ? ReadOutcome::kAborted : ReadOutcome::kCompleted;
	{
		absl::MutexLock lock(&error_mu_);
		result.error_keys.assign(error_keys_.begin(), error_keys_.end());
	}
	LOG(INFO) << "Readers " << (result.aborted() ? "aborted" : "finished") << ": "
		<< result.stats.keys_read << " keys read, " << result.stats.verified << " verified, "
		<< result.stats.errors << " errors, " << result.stats.skipped << " skipped";
	return result;
}

ErrorStats ReaderEngine::GetStats() const {
	ErrorStats stats;
	stats.keys_read = keys_read_.load();
	stats.verified = verified_.load();
	stats.errors = errors_.load();
	stats.skipped = skipped_.load();
	return stats;
}

}  // namespace KvLoad
