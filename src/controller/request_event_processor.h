#ifndef TIDEWATER_CONTROLLER_REQUEST_EVENT_PROCESSOR_H_
#define TIDEWATER_CONTROLLER_REQUEST_EVENT_PROCESSOR_H_

#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include <folly/Executor.h>
#include <folly/futures/Future.h>

#include "interfaces.h"
#include "request_stream.h"

namespace Tidewater {

struct RequestProcessorOptions {
	int initial_backoff_ms = 100;
	int max_backoff_ms = 10000;
	// Failed executions per stream before the event is dropped. 0 never drops.
	int max_attempts = 0;
};

struct RequestProcessorStats {
	size_t completed = 0;
	size_t postponed = 0;
	size_t retried = 0;
	size_t dropped = 0;
};

/**
 * Pulls events off the request stream and runs the seal task on them.
 *
 * One reader thread hands each event to the task and goes back to reading;
 * executions proceed on the executor. A failed execution is written back to
 * the request stream after a backoff that grows with the number of failures
 * seen for that stream.
 */
class RequestEventProcessor {
	public:
		RequestEventProcessor(RequestStream& request_stream,
				StreamTask<SealStreamEvent>& task,
				folly::Executor* executor,
				RequestProcessorOptions options,
				folly::Timekeeper* timekeeper = nullptr);
		~RequestEventProcessor();

		void Start();

		/// Stops reading and waits for executions and write-backs in flight.
		/// Events still on the stream stay there.
		void Stop();

		/// Blocks until `predicate` holds on the stats or the timeout expires.
		bool WaitUntil(const std::function<bool(const RequestProcessorStats&)>& predicate,
				absl::Duration timeout);

		RequestProcessorStats GetStats();

	private:
		void ReaderThread();
		void Process(const SealStreamEvent& event);
		void OnSuccess(const SealStreamEvent& event);
		void OnFailure(const SealStreamEvent& event, const folly::exception_wrapper& ew);
		void Done();
		std::chrono::milliseconds BackoffFor(int attempt) const;

		static std::string StreamKey(const SealStreamEvent& event) {
			return event.scope() + "/" + event.stream();
		}

		RequestStream& request_stream_;
		StreamTask<SealStreamEvent>& task_;
		folly::Executor::KeepAlive<> executor_;
		const RequestProcessorOptions options_;
		folly::Timekeeper* timekeeper_;

		std::thread reader_;
		bool started_ = false;

		absl::Mutex mutex_;
		int in_flight_ ABSL_GUARDED_BY(mutex_) = 0;
		absl::flat_hash_map<std::string, int> attempts_ ABSL_GUARDED_BY(mutex_);
		RequestProcessorStats stats_ ABSL_GUARDED_BY(mutex_);
};

} // End of namespace Tidewater

#endif // TIDEWATER_CONTROLLER_REQUEST_EVENT_PROCESSOR_H_
