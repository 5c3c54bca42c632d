#include "load_test_driver.h"

#include <memory>
#include <stdexcept>
#include <string>

#include <glog/logging.h>

namespace KvLoad {

bool LoadTestReport::Succeeded() const {
	if (wrote && !write_status.ok()) {
		return false;
	}
	if (read && (read_result.aborted() || read_result.stats.errors > 0)) {
		return false;
	}
	return true;
}

LoadTestDriver::LoadTestDriver(StorageClient* client) : client_(client) {}

LoadTestReport LoadTestDriver::Run(const LoadTestOptions& options) {
	if (!options.write && !options.read) {
		throw std::invalid_argument("Either write or read has to be requested");
	}
	if (options.range.Empty()) {
		throw std::invalid_argument("Empty key range [" + std::to_string(options.range.start) + ", " +
				std::to_string(options.range.end) + ")");
	}
	if (options.write && options.writer_threads < 1) {
		throw std::invalid_argument("Writer thread count must be at least 1, got " +
				std::to_string(options.writer_threads));
	}
	if (options.read && options.reader_threads < 1) {
		throw std::invalid_argument("Reader thread count must be at least 1, got " +
				std::to_string(options.reader_threads));
	}

	std::unique_ptr<WriterEngine> writer;
	std::unique_ptr<ReaderEngine> reader;

	if (options.write) {
		writer = std::make_unique<WriterEngine>(client_);
		writer->Configure(options.writer);
	}
	if (options.read) {
		ReaderOptions reader_options = options.reader;
		if (options.write) {
			reader_options.bounds = options.writer.bounds;
		}
		reader = std::make_unique<ReaderEngine>(client_);
		reader->Configure(reader_options);
	}
	if (writer && reader) {
		LOG(INFO) << "Concurrent read/write workload: making readers aware of the write point";
		reader->LinkToWriter(writer.get());
	}

	LOG(INFO) << "Key range: " << options.range.start << ".." << options.range.end - 1;
	if (writer) {
		LOG(INFO) << "Starting to write data...";
		writer->Start(options.range, options.writer_threads);
	}
	if (reader) {
		LOG(INFO) << "Starting to read data...";
		reader->Start(options.range, options.reader_threads);
	}

	LoadTestReport report;
	if (writer) {
		report.wrote = true;
		report.write_status = writer->WaitForFinish();
		report.writer_stats = writer->GetStats();
		report.watermark = writer->Watermark();
	}
	if (reader) {
		report.read = true;
		report.read_result = reader->WaitForFinish();
	}
	return report;
}

}  // namespace KvLoad
