#include "record_generator.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace KvLoad {

namespace {

constexpr uint64_t kGoldenGamma = 0x9e3779b97f4a7c15ULL;
constexpr uint64_t kColumnCountSalt = 0x243f6a8885a308d3ULL;
constexpr char kPayloadAlphabet[] =
	"0123456789"
	"ABCDEFGHIJKLMNOPQRSTUVWXYZ"
	"abcdefghijklmnopqrstuvwxyz"
	"-_";

// splitmix64: a full-period 64-bit sequence, identical on every platform.
class SplitMix64 {
	public:
		explicit SplitMix64(uint64_t seed) : state_(seed) {}

		uint64_t Next() {
			uint64_t z = (state_ += kGoldenGamma);
			z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
			z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
			return z ^ (z >> 31);
		}

		// Uniform draw from [lo, hi].
		uint64_t Between(uint64_t lo, uint64_t hi) {
			if (hi <= lo) {
				return lo;
			}
			uint64_t span = hi - lo + 1;
			if (span == 0) {
				return Next();
			}
			return lo + Next() % span;
		}

	private:
		uint64_t state_;
};

uint64_t ColumnSeed(int64_t key, uint32_t column) {
	SplitMix64 mix(static_cast<uint64_t>(key));
	return mix.Next() ^ (static_cast<uint64_t>(column) + 1) * kGoldenGamma;
}

}  // namespace

RecordGenerator::RecordGenerator(const GeneratorBounds& bounds) : bounds_(bounds) {
	ValidateBounds(bounds_);
}

void RecordGenerator::ValidateBounds(const GeneratorBounds& bounds) {
	if (bounds.min_cols == 0) {
		throw std::invalid_argument("min_cols must be at least 1");
	}
	if (bounds.min_cols > bounds.max_cols) {
		throw std::invalid_argument("min_cols (" + std::to_string(bounds.min_cols) +
				") is greater than max_cols (" + std::to_string(bounds.max_cols) + ")");
	}
	if (bounds.min_size > bounds.max_size) {
		throw std::invalid_argument("min_size (" + std::to_string(bounds.min_size) +
				") is greater than max_size (" + std::to_string(bounds.max_size) + ")");
	}
}

uint32_t RecordGenerator::ColumnCount(int64_t key) const {
	SplitMix64 rng(static_cast<uint64_t>(key) ^ kColumnCountSalt);
	return static_cast<uint32_t>(rng.Between(bounds_.min_cols, bounds_.max_cols));
}

std::string RecordGenerator::GenerateColumn(int64_t key, uint32_t column) const {
	SplitMix64 rng(ColumnSeed(key, column));
	const size_t size = static_cast<size_t>(rng.Between(bounds_.min_size, bounds_.max_size));

	std::string value;
	value.reserve(size);
	const std::string header = std::to_string(key) + ":" + std::to_string(column) + ":";
	value.append(header, 0, std::min(size, header.size()));

	constexpr size_t kAlphabetSize = sizeof(kPayloadAlphabet) - 1;
	while (value.size() < size) {
		uint64_t bits = rng.Next();
		for (int i = 0; i < 10 && value.size() < size; ++i) {
			value.push_back(kPayloadAlphabet[(bits & 0x3f) % kAlphabetSize]);
			bits >>= 6;
		}
	}
	return value;
}

GeneratedRecord RecordGenerator::Generate(int64_t key) const {
	GeneratedRecord record;
	record.key = key;
	const uint32_t num_cols = ColumnCount(key);
	for (uint32_t col = 0; col < num_cols; ++col) {
		record.columns.emplace(col, GenerateColumn(key, col));
	}
	return record;
}

std::optional<std::string> DescribeMismatch(const ColumnMap& expected, const ColumnMap& actual) {
	for (const auto& [col, value] : expected) {
		auto it = actual.find(col);
		if (it == actual.end()) {
			return "missing column " + std::to_string(col);
		}
		if (it->second == value) {
			continue;
		}
		std::ostringstream os;
		os << "column " << col << " differs: expected " << value.size() << " bytes, got "
			<< it->second.size() << " bytes";
		auto diff = std::mismatch(value.begin(), value.end(), it->second.begin(), it->second.end());
		os << ", first difference at offset " << (diff.first - value.begin());
		return os.str();
	}
	for (const auto& [col, value] : actual) {
		if (expected.find(col) == expected.end()) {
			return "unexpected column " + std::to_string(col) + " (" +
				std::to_string(value.size()) + " bytes)";
		}
	}
	return std::nullopt;
}

}  // namespace KvLoad
