#include "progress_reporter.h"

#include <iomanip>
#include <utility>

#include <glog/logging.h>

#include "absl/time/time.h"

namespace KvLoad {

ProgressReporter::ProgressReporter(std::string name, int64_t total_keys,
		std::chrono::milliseconds interval,
		std::function<int64_t()> processed_keys,
		std::function<std::string()> detail)
	: name_(std::move(name)),
	total_keys_(total_keys),
	interval_(interval),
	processed_keys_(std::move(processed_keys)),
	detail_(std::move(detail)) {}

ProgressReporter::~ProgressReporter() {
	Stop();
}

void ProgressReporter::Start() {
	started_ = true;
	start_time_ = std::chrono::steady_clock::now();
	last_log_time_ = start_time_;
	if (interval_.count() <= 0) {
		return;
	}
	thread_ = std::thread([this]() { Run(); });
}

void ProgressReporter::Stop() {
	if (!started_ || stop_.HasBeenNotified()) {
		return;
	}
	stop_.Notify();
	if (thread_.joinable()) {
		thread_.join();
	}
	Report();
}

void ProgressReporter::Run() {
	while (!stop_.WaitForNotificationWithTimeout(absl::FromChrono(interval_))) {
		Report();
	}
}

void ProgressReporter::Report() {
	auto now = std::chrono::steady_clock::now();
	const int64_t processed = processed_keys_();
	const double since_last = std::chrono::duration<double>(now - last_log_time_).count();
	const double total_elapsed = std::chrono::duration<double>(now - start_time_).count();
	const double rate = since_last > 0 ? (processed - last_processed_) / since_last : 0.0;
	const double progress_pct = total_keys_ > 0 ? (100.0 * processed) / total_keys_ : 100.0;

	LOG(INFO) << "[" << name_ << "] " << std::fixed << std::setprecision(1) << progress_pct << "% "
		<< "(" << processed << "/" << total_keys_ << " keys) "
		<< "Rate: " << std::setprecision(2) << rate << " keys/sec, "
		<< "Elapsed: " << std::setprecision(0) << total_elapsed << " sec, "
		<< detail_();

	last_log_time_ = now;
	last_processed_ = processed;
}

}  // namespace KvLoad
