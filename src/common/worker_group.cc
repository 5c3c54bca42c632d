#include "worker_group.h"

#include <stdexcept>
#include <utility>

#include <glog/logging.h>

namespace KvLoad {

WorkerGroup::WorkerGroup(std::string name) : name_(std::move(name)) {}

WorkerGroup::~WorkerGroup() {
	Join();
}

void WorkerGroup::Start(int num_workers, std::function<void(int)> body) {
	{
		absl::MutexLock lock(&mu_);
		if (started_) {
			throw std::logic_error(name_ + " workers already started");
		}
		started_ = true;
	}
	threads_.reserve(num_workers);
	for (int i = 0; i < num_workers; ++i) {
		threads_.emplace_back(body, i);
	}
	VLOG(1) << "Started " << num_workers << " " << name_ << " workers";
}

void WorkerGroup::Join() {
	for (auto& t : threads_) {
		if (t.joinable()) {
			t.join();
		}
	}
	threads_.clear();
}

}  // namespace KvLoad
