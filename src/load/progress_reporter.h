#ifndef KVLOAD_SRC_LOAD_PROGRESS_REPORTER_H_
#define KVLOAD_SRC_LOAD_PROGRESS_REPORTER_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

#include "absl/synchronization/notification.h"

namespace KvLoad {

/**
 * Background thread that periodically logs how many keys a pool processed,
 * the rate since the previous report and a pool-specific detail string.
 */
class ProgressReporter {
	public:
		ProgressReporter(std::string name, int64_t total_keys,
				std::chrono::milliseconds interval,
				std::function<int64_t()> processed_keys,
				std::function<std::string()> detail);
		~ProgressReporter();

		ProgressReporter(const ProgressReporter&) = delete;
		ProgressReporter& operator=(const ProgressReporter&) = delete;

		void Start();

		// Logs a final report and joins the thread.
		void Stop();

	private:
		void Run();
		void Report();

		const std::string name_;
		const int64_t total_keys_;
		const std::chrono::milliseconds interval_;
		std::function<int64_t()> processed_keys_;
		std::function<std::string()> detail_;

		absl::Notification stop_;
		std::thread thread_;
		bool started_ = false;

		std::chrono::steady_clock::time_point start_time_;
		std::chrono::steady_clock::time_point last_log_time_;
		int64_t last_processed_ = 0;
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_LOAD_PROGRESS_REPORTER_H_
