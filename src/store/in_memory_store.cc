#include "in_memory_store.h"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <random>
#include <thread>

namespace KvLoad {

namespace {

size_t RoundUpPowerOfTwo(size_t n) {
	size_t p = 1;
	while (p < n) {
		p <<= 1;
	}
	return p;
}

}  // namespace

InMemoryStore::InMemoryStore(const InMemoryStoreOptions& options)
	: shard_mask_(RoundUpPowerOfTwo(std::max<size_t>(1, options.num_shards)) - 1),
	max_op_delay_us_(options.max_op_delay_us) {
	shards_.reserve(shard_mask_ + 1);
	for (size_t i = 0; i <= shard_mask_; ++i) {
		shards_.push_back(std::make_unique<Shard>());
	}
}

void InMemoryStore::SimulateLatency() const {
	if (max_op_delay_us_ == 0) {
		return;
	}
	static thread_local std::mt19937 gen(std::random_device{}());
	std::uniform_int_distribution<uint32_t> dist(0, max_op_delay_us_);
	std::this_thread::sleep_for(std::chrono::microseconds(dist(gen)));
}

absl::Status InMemoryStore::Write(int64_t key, const ColumnMap& columns) {
	SimulateLatency();
	Shard& shard = ShardFor(key);
	std::unique_lock<std::shared_mutex> lock(shard.mutex);
	ColumnMap& row = shard.rows[key];
	for (const auto& [col, value] : columns) {
		row[col] = value;
	}
	return absl::OkStatus();
}

absl::StatusOr<std::optional<ColumnMap>> InMemoryStore::Read(int64_t key) {
	SimulateLatency();
	const Shard& shard = ShardFor(key);
	std::shared_lock<std::shared_mutex> lock(shard.mutex);
	auto it = shard.rows.find(key);
	if (it == shard.rows.end()) {
		return std::optional<ColumnMap>();
	}
	return std::optional<ColumnMap>(it->second);
}

bool InMemoryStore::Corrupt(int64_t key, uint32_t column, const std::string& value) {
	Shard& shard = ShardFor(key);
	std::unique_lock<std::shared_mutex> lock(shard.mutex);
	auto it = shard.rows.find(key);
	if (it == shard.rows.end()) {
		return false;
	}
	it->second[column] = value;
	return true;
}

bool InMemoryStore::Remove(int64_t key) {
	Shard& shard = ShardFor(key);
	std::unique_lock<std::shared_mutex> lock(shard.mutex);
	return shard.rows.erase(key) > 0;
}

bool InMemoryStore::Contains(int64_t key) const {
	const Shard& shard = ShardFor(key);
	std::shared_lock<std::shared_mutex> lock(shard.mutex);
	return shard.rows.contains(key);
}

std::vector<int64_t> InMemoryStore::KeysInRange(int64_t start, int64_t end) const {
	std::vector<int64_t> keys;
	for (const auto& shard : shards_) {
		std::shared_lock<std::shared_mutex> lock(shard->mutex);
		for (auto it = shard->rows.lower_bound(start); it != shard->rows.end() && it->first < end; ++it) {
			keys.push_back(it->first);
		}
	}
	std::sort(keys.begin(), keys.end());
	return keys;
}

size_t InMemoryStore::size() const {
	size_t total = 0;
	for (const auto& shard : shards_) {
		std::shared_lock<std::shared_mutex> lock(shard->mutex);
		total += shard->rows.size();
	}
	return total;
}

void InMemoryStore::clear() {
	for (auto& shard : shards_) {
		std::unique_lock<std::shared_mutex> lock(shard->mutex);
		shard->rows.clear();
	}
}

}  // namespace KvLoad
