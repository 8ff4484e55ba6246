#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <folly/executors/CPUThreadPoolExecutor.h>

// Project includes
#include "common/configuration.h"
#include "store/in_memory_stream_store.h"
#include "grpc_segment_notifier.h"
#include "request_event_processor.h"
#include "request_stream.h"
#include "seal_stream_task.h"
#include "stream_metadata_tasks.h"
#include "stream_transaction_tasks.h"

namespace {

struct StreamName {
	std::string scope;
	std::string stream;
};

bool ParseStreamName(const std::string& value, StreamName& name) {
	size_t slash = value.find('/');
	if (slash == std::string::npos || slash == 0 || slash == value.size() - 1) {
		return false;
	}
	name.scope = value.substr(0, slash);
	name.stream = value.substr(slash + 1);
	return true;
}

bool CreateBootstrapStreams(Tidewater::InMemoryStreamStore& store,
		const std::vector<Tidewater::StreamBootstrap>& streams) {
	for (const auto& stream : streams) {
		try {
			store.CreateStream(stream.scope, stream.name, stream.num_segments).get();
			LOG(INFO) << "Created stream " << stream.scope << "/" << stream.name
				<< " with " << stream.num_segments << " segments";
		} catch (const std::exception& e) {
			LOG(ERROR) << "Failed to create stream " << stream.scope << "/" << stream.name
				<< ": " << e.what();
			return false;
		}
	}
	return true;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("tidewater_controller",
			"Stream controller that processes seal-stream requests");

	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("seal", "Stream to seal, as scope/stream", cxxopts::value<std::vector<std::string>>())
		("segment_store", "Segment store address (host:port)", cxxopts::value<std::string>())
		("wait_ms", "How long to wait for the requested seals to finish",
		 cxxopts::value<int>()->default_value("30000"))
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Tidewater::Configuration& configuration = Tidewater::Configuration::getInstance();
	if (arguments.count("config") &&
			!configuration.loadFromFile(arguments["config"].as<std::string>())) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}
	if (arguments.count("segment_store")) {
		configuration.config().segment_store.address.set(arguments["segment_store"].as<std::string>());
	}
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}
	const Tidewater::ControllerConfig& config = configuration.config();

	std::vector<StreamName> to_seal;
	if (arguments.count("seal")) {
		for (const auto& value : arguments["seal"].as<std::vector<std::string>>()) {
			StreamName name;
			if (!ParseStreamName(value, name)) {
				LOG(ERROR) << "--seal expects scope/stream, got '" << value << "'";
				return EXIT_FAILURE;
			}
			to_seal.push_back(name);
		}
	}

	// *************** Initialize components **********************
	folly::CPUThreadPoolExecutor executor(configuration.getWorkerThreads());

	Tidewater::InMemoryStreamStore store(&executor);
	if (!CreateBootstrapStreams(store, configuration.getBootstrapStreams())) {
		return EXIT_FAILURE;
	}

	Tidewater::StreamTransactionTasks txn_tasks(store, &executor);
	Tidewater::GrpcSegmentNotifier segment_notifier(configuration.getSegmentStoreAddress(),
			&executor, config.auth.enabled.get(), config.auth.token.get());
	if (!segment_notifier.Connect(config.segment_store.connect_timeout_ms.get())) {
		LOG(WARNING) << "Segment store not reachable yet, seal requests will be retried";
	}

	Tidewater::RequestStream request_stream(configuration.getRequestQueueCapacity());
	Tidewater::SealStreamTask seal_task(store, txn_tasks, segment_notifier, request_stream, &executor);

	Tidewater::RequestProcessorOptions processor_options;
	processor_options.initial_backoff_ms = config.request_processor.initial_backoff_ms.get();
	processor_options.max_backoff_ms = config.request_processor.max_backoff_ms.get();
	processor_options.max_attempts = config.request_processor.max_attempts.get();
	Tidewater::RequestEventProcessor processor(request_stream, seal_task, &executor, processor_options);
	processor.Start();

	Tidewater::StreamMetadataTasks stream_tasks(store, request_stream, &executor);

	// *************** Seal requested streams **********************
	bool failed = false;
	for (const auto& name : to_seal) {
		try {
			stream_tasks.SealStream(name.scope, name.stream).get();
		} catch (const std::exception& e) {
			LOG(ERROR) << "Seal request for " << name.scope << "/" << name.stream
				<< " rejected: " << e.what();
			failed = true;
		}
	}

	auto deadline = std::chrono::steady_clock::now() +
		std::chrono::milliseconds(arguments["wait_ms"].as<int>());
	size_t sealed = 0;
	while (!to_seal.empty()) {
		sealed = 0;
		for (const auto& name : to_seal) {
			try {
				if (stream_tasks.IsSealed(name.scope, name.stream).get()) {
					sealed++;
				}
			} catch (const std::exception& e) {
				VLOG(1) << "State of " << name.scope << "/" << name.stream << " unknown: " << e.what();
			}
		}
		if (sealed == to_seal.size() || std::chrono::steady_clock::now() >= deadline) {
			break;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}

	if (sealed != to_seal.size()) {
		LOG(ERROR) << "Only " << sealed << " of " << to_seal.size() << " streams sealed before the deadline";
		failed = true;
	}

	processor.Stop();
	executor.join();

	LOG(INFO) << "Tidewater controller exiting";
	return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
