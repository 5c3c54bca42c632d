#include "writer_engine.h"

#include <exception>
#include <stdexcept>
#include <string>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"

namespace KvLoad {

WriterEngine::WriterEngine(StorageClient* client) : client_(client) {
	if (client_ == nullptr) {
		throw std::invalid_argument("WriterEngine requires a storage client");
	}
}

WriterEngine::~WriterEngine() {
	if (workers_) {
		stop_requested_.store(true);
		workers_->Join();
	}
	if (reporter_) {
		reporter_->Stop();
	}
}

void WriterEngine::Configure(const WriterOptions& options) {
	if (started_.load()) {
		throw std::logic_error("WriterEngine::Configure called after Start");
	}
	RecordGenerator::ValidateBounds(options.bounds);
	options_ = options;
	configured_ = true;
	LOG(INFO) << "Writer configured: multi-puts=" << options_.multi_put
		<< " columns per key=" << options_.bounds.min_cols << ".." << options_.bounds.max_cols
		<< " data size per column=" << options_.bounds.min_size << ".." << options_.bounds.max_size;
}

void WriterEngine::Start(const KeyRange& range, int num_threads) {
	if (!configured_) {
		throw std::logic_error("WriterEngine::Start called before Configure");
	}
	if (started_.load()) {
		throw std::logic_error("WriterEngine already started");
	}
	if (range.Empty()) {
		throw std::invalid_argument("Empty key range [" + std::to_string(range.start) + ", " +
				std::to_string(range.end) + ")");
	}
	if (num_threads < 1) {
		throw std::invalid_argument("Writer thread count must be at least 1, got " +
				std::to_string(num_threads));
	}

	range_ = range;
	generator_ = std::make_unique<RecordGenerator>(options_.bounds);
	partitioner_ = std::make_unique<KeyPartitioner>(range_);
	watermark_ = std::make_unique<WriteWatermark>(range_.start);
	workers_ = std::make_unique<WorkerGroup>("writer");
	active_workers_.store(num_threads);
	started_.store(true, std::memory_order_release);

	reporter_ = std::make_unique<ProgressReporter>("writer", range_.Size(), options_.progress_interval,
			[this]() {
				WriterStats stats = GetStats();
				return stats.keys_written + stats.failed_keys;
			},
			[this]() {
				WriterStats stats = GetStats();
				return absl::StrCat("columns: ", stats.columns_written,
						", contiguous insertion point: ", Watermark(),
						", write errors: ", stats.failed_keys);
			});
	reporter_->Start();

	LOG(INFO) << "Starting " << num_threads << " writer threads for keys "
		<< range_.start << ".." << range_.end - 1;
	workers_->Start(num_threads, [this](int index) { WorkerLoop(index); });
}

void WriterEngine::WorkerLoop(int index) {
	VLOG(1) << "Writer thread " << index << " started";
	while (!stop_requested_.load(std::memory_order_acquire)) {
		std::optional<int64_t> key = partitioner_->NextKey();
		if (!key) {
			break;
		}
		GeneratedRecord record = generator_->Generate(*key);
		absl::Status status = WriteRecord(record);
		if (!status.ok()) {
			RecordFailure(*key, status);
			continue;
		}
		keys_written_.fetch_add(1, std::memory_order_relaxed);
		int64_t wm = watermark_->MarkCompleted(*key);
		VLOG(3) << "Writer " << index << " wrote key #" << *key << ", watermark " << wm;
	}
	VLOG(1) << "Writer thread " << index << " finished";
	if (active_workers_.fetch_sub(1) == 1) {
		finished_.store(true, std::memory_order_release);
	}
}

absl::Status WriterEngine::WriteRecord(const GeneratedRecord& record) {
	try {
		if (options_.multi_put) {
			absl::Status status = client_->Write(record.key, record.columns);
			if (!status.ok()) {
				return status;
			}
		} else {
			for (const auto& [col, value] : record.columns) {
				absl::Status status = client_->Write(record.key, ColumnMap{{col, value}});
				if (!status.ok()) {
					return absl::Status(status.code(),
							absl::StrCat("column ", col, ": ", status.message()));
				}
			}
		}
	} catch (const std::exception& e) {
		return absl::InternalError(absl::StrCat("storage client threw: ", e.what()));
	}

	int64_t bytes = 0;
	for (const auto& [col, value] : record.columns) {
		bytes += static_cast<int64_t>(value.size());
	}
	columns_written_.fetch_add(static_cast<int64_t>(record.columns.size()), std::memory_order_relaxed);
	bytes_written_.fetch_add(bytes, std::memory_order_relaxed);
	return absl::OkStatus();
}

void WriterEngine::RecordFailure(int64_t key, const absl::Status& status) {
	LOG(ERROR) << "Failed to insert key #" << key << ": " << status;
	size_t num_failed;
	{
		absl::MutexLock lock(&failure_mu_);
		failed_keys_.insert(key);
		if (first_error_.ok()) {
			first_error_ = absl::Status(status.code(),
					absl::StrCat("write of key #", key, " failed: ", status.message()));
		}
		num_failed = failed_keys_.size();
	}
	if (options_.max_write_errors >= 0 &&
			static_cast<int64_t>(num_failed) > options_.max_write_errors &&
			!stop_requested_.exchange(true)) {
		LOG(ERROR) << "Exceeded the maximum number of write errors " << options_.max_write_errors
			<< ", stopping the writers";
	}
}

absl::Status WriterEngine::WaitForFinish() {
	if (!started_.load()) {
		throw std::logic_error("WriterEngine::WaitForFinish called before Start");
	}
	workers_->Join();
	reporter_->Stop();

	WriterStats stats = GetStats();
	LOG(INFO) << "Writers finished: " << stats.keys_written << " keys, "
		<< stats.columns_written << " columns, " << stats.bytes_written << " bytes written, "
		<< stats.failed_keys << " failed keys. Inserted up to and including " << Watermark();

	absl::MutexLock lock(&failure_mu_);
	return first_error_;
}

int64_t WriterEngine::Watermark() const {
	if (!started_.load(std::memory_order_acquire)) {
		return kNoWatermark;
	}
	return watermark_->Value();
}

bool WriterEngine::Finished() const {
	return finished_.load(std::memory_order_acquire);
}

bool WriterEngine::FailedToWrite(int64_t key) const {
	absl::MutexLock lock(&failure_mu_);
	return failed_keys_.contains(key);
}

WriterStats WriterEngine::GetStats() const {
	WriterStats stats;
	stats.keys_written = keys_written_.load();
	stats.columns_written = columns_written_.load();
	stats.bytes_written = bytes_written_.load();
	absl::MutexLock lock(&failure_mu_);
	stats.failed_keys = static_cast<int64_t>(failed_keys_.size());
	return stats;
}

std::vector<int64_t> WriterEngine::FailedKeys() const {
	absl::MutexLock lock(&failure_mu_);
	return std::vector<int64_t>(failed_keys_.begin(), failed_keys_.end());
}

}  // namespace KvLoad
