#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../common/configuration.h"
#include "../load/load_test_driver.h"
#include "../store/in_memory_store.h"
#include "tool_options.h"

namespace {

// Folds command line switches into the configuration as overrides of both the
// file and the environment. Throws std::invalid_argument on malformed --write /
// --read values.
void ApplyCommandLine(const cxxopts::ParseResult& result, KvLoad::KvLoadConfig& config) {
	if (result.count("tn")) {
		config.workload.table_name.setOverride(result["tn"].as<std::string>());
	}
	if (result.count("start_key")) {
		config.workload.start_key.setOverride(result["start_key"].as<int64_t>());
	}
	if (result.count("num_keys")) {
		config.workload.num_keys.setOverride(result["num_keys"].as<int64_t>());
	}
	if (result.count("write")) {
		KvLoad::ApplyWriteArgs(KvLoad::ParseWriteArgs(result["write"].as<std::string>()), config);
	}
	if (result.count("multiput")) {
		config.writer.multi_put.setOverride(true);
	}
	if (result.count("read")) {
		KvLoad::ApplyReadArgs(KvLoad::ParseReadArgs(result["read"].as<std::string>()), config);
	}
	if (result.count("max_read_errors")) {
		config.reader.max_read_errors.setOverride(result["max_read_errors"].as<int>());
	}
	if (result.count("key_window")) {
		config.reader.key_window.setOverride(result["key_window"].as<int>());
	}
}

void PrintSummary(const KvLoad::KvLoadConfig& config, const KvLoad::LoadTestReport& report) {
	if (report.wrote) {
		std::cout << "Write: " << report.writer_stats.keys_written << " keys, "
			<< report.writer_stats.columns_written << " columns, "
			<< report.writer_stats.bytes_written << " bytes, "
			<< report.writer_stats.failed_keys << " failed keys";
		if (!report.write_status.ok()) {
			std::cout << " (" << report.write_status.message() << ")";
		}
		std::cout << std::endl;
	}
	if (report.read) {
		const KvLoad::ErrorStats& stats = report.read_result.stats;
		std::cout << "Read: " << stats.keys_read << " keys, " << stats.verified << " verified, "
			<< stats.errors << " errors, " << stats.skipped << " skipped"
			<< (report.read_result.aborted() ? " (aborted)" : "") << std::endl;
	}
	std::cout << "Load test on " << config.workload.table_name.get() << ":"
		<< config.workload.column_family.get() << " "
		<< (report.Succeeded() ? "PASSED" : "FAILED") << std::endl;
}

int RunLoadTest(const cxxopts::ParseResult& result) {
	FLAGS_v = result["log_level"].as<int>();

	KvLoad::Configuration& configuration = KvLoad::Configuration::getInstance();
	if (result.count("config")) {
		const std::string path = result["config"].as<std::string>();
		if (!configuration.loadFromFile(path)) {
			LOG(ERROR) << "Failed to load configuration from " << path;
			return 1;
		}
	}

	KvLoad::KvLoadConfig& config = configuration.config();
	try {
		ApplyCommandLine(result, config);
	} catch (const std::invalid_argument& e) {
		std::cerr << e.what() << std::endl;
		return 1;
	}

	if (!configuration.validate()) {
		for (const std::string& error : configuration.getValidationErrors()) {
			std::cerr << "Invalid configuration: " << error << std::endl;
		}
		return 1;
	}

	KvLoad::LoadTestOptions load_options = KvLoad::BuildLoadTestOptions(config);
	if (load_options.write) {
		LOG(INFO) << "Multi-puts: " << load_options.writer.multi_put;
		LOG(INFO) << "Columns per key: " << load_options.writer.bounds.min_cols << ".."
			<< load_options.writer.bounds.max_cols;
		LOG(INFO) << "Data size per column: " << load_options.writer.bounds.min_size << ".."
			<< load_options.writer.bounds.max_size;
	}
	if (load_options.read) {
		LOG(INFO) << "Percent of keys to verify: " << load_options.reader.verify_percent;
		LOG(INFO) << "Reader threads: " << load_options.reader_threads;
	}

	KvLoad::InMemoryStoreOptions store_options;
	store_options.num_shards = config.store.num_shards.get();
	store_options.max_op_delay_us = static_cast<uint32_t>(config.store.max_op_delay_us.get());
	KvLoad::InMemoryStore store(store_options);

	KvLoad::LoadTestDriver driver(&store);
	KvLoad::LoadTestReport report;
	try {
		report = driver.Run(load_options);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Load test could not run: " << e.what();
		return 1;
	}

	PrintSummary(config, report);
	return report.Succeeded() ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	cxxopts::Options options("kvload", "Multi-threaded key-value load generator and verifier");
	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("tn", "The name of the table to read or write", cxxopts::value<std::string>())
		("write", "<avg_cols_per_key>:<avg_data_size>[:<#threads=20>]", cxxopts::value<std::string>())
		("read", "<verify_percent>[:<#threads=20>]", cxxopts::value<std::string>())
		("multiput", "Use one put per row instead of separate puts for every column")
		("max_read_errors", "Read errors tolerated before all readers stop",
		 cxxopts::value<int>())
		("key_window", "Keys to keep between reads and writes in a concurrent workload",
		 cxxopts::value<int>())
		("num_keys", "The number of keys to read/write", cxxopts::value<int64_t>())
		("start_key", "The first key to read/write", cxxopts::value<int64_t>())
		("h,help", "Print usage");

	try {
		auto result = options.parse(argc, argv);
		if (result.count("help")) {
			std::cout << options.help() << std::endl;
			return 0;
		}
		return RunLoadTest(result);
	} catch (const std::exception& e) {
		// Unknown options or option values of the wrong type
		std::cerr << e.what() << std::endl << options.help() << std::endl;
		return 1;
	}
}

