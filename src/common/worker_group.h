#ifndef KVLOAD_SRC_COMMON_WORKER_GROUP_H_
#define KVLOAD_SRC_COMMON_WORKER_GROUP_H_

#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"

namespace KvLoad {

/**
 * Fixed set of worker threads with a join barrier.
 * The body receives the worker index.
 */
class WorkerGroup {
	public:
		explicit WorkerGroup(std::string name);
		~WorkerGroup();

		WorkerGroup(const WorkerGroup&) = delete;
		WorkerGroup& operator=(const WorkerGroup&) = delete;

		/**
		 * Spawns num_workers threads running body(index).
		 * @throws std::logic_error if the group was already started
		 */
		void Start(int num_workers, std::function<void(int)> body);

		// Blocks until every worker exited and joins the threads.
		void Join();

	private:
		const std::string name_;
		absl::Mutex mu_;
		bool started_ ABSL_GUARDED_BY(mu_) = false;
		std::vector<std::thread> threads_;
};

}  // namespace KvLoad

#endif  // KVLOAD_SRC_COMMON_WORKER_GROUP_H_
