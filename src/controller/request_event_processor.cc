#include "request_event_processor.h"

#include <algorithm>

#include <glog/logging.h>

#include "error_classification.h"

namespace Tidewater {

RequestEventProcessor::RequestEventProcessor(RequestStream& request_stream,
		StreamTask<SealStreamEvent>& task,
		folly::Executor* executor,
		RequestProcessorOptions options,
		folly::Timekeeper* timekeeper)
	: request_stream_(request_stream),
	  task_(task),
	  executor_(folly::getKeepAliveToken(executor)),
	  options_(options),
	  timekeeper_(timekeeper) {
	CHECK(executor != nullptr) << "RequestEventProcessor needs an executor";
	VLOG(3) << "\t[RequestEventProcessor]\tConstructed";
}

RequestEventProcessor::~RequestEventProcessor() {
	Stop();
	VLOG(3) << "\t[RequestEventProcessor]\tDestructed";
}

void RequestEventProcessor::Start() {
	if (started_) {
		return;
	}
	started_ = true;
	reader_ = std::thread(&RequestEventProcessor::ReaderThread, this);
	LOG(INFO) << "Request event processor started";
}

void RequestEventProcessor::Stop() {
	if (!started_) {
		return;
	}
	started_ = false;
	request_stream_.Close();
	if (reader_.joinable()) {
		reader_.join();
	}
	absl::MutexLock lock(&mutex_);
	mutex_.Await(absl::Condition(
				+[](int* in_flight) { return *in_flight == 0; }, &in_flight_));
	LOG(INFO) << "Request event processor stopped: " << stats_.completed << " completed, "
		<< stats_.postponed << " postponed, " << stats_.retried << " retried, "
		<< stats_.dropped << " dropped";
}

bool RequestEventProcessor::WaitUntil(
		const std::function<bool(const RequestProcessorStats&)>& predicate,
		absl::Duration timeout) {
	absl::MutexLock lock(&mutex_);
	auto satisfied = [this, &predicate]() {
		return predicate(stats_);
	};
	return mutex_.AwaitWithTimeout(absl::Condition(&satisfied), timeout);
}

RequestProcessorStats RequestEventProcessor::GetStats() {
	absl::MutexLock lock(&mutex_);
	return stats_;
}

void RequestEventProcessor::ReaderThread() {
	while (std::optional<SealStreamEvent> event = request_stream_.Read()) {
		Process(event.value());
	}
	VLOG(1) << "Request stream closed, reader exiting";
}

void RequestEventProcessor::Process(const SealStreamEvent& event) {
	{
		absl::MutexLock lock(&mutex_);
		in_flight_++;
	}
	VLOG(2) << "Processing seal request " << event.request_id() << " for " << StreamKey(event);
	folly::makeFutureWith([this, event]() { return task_.Execute(event); })
		.via(executor_.copy())
		.thenTry([this, event](folly::Try<folly::Unit>&& result) {
			if (result.hasValue()) {
				OnSuccess(event);
				Done();
				return;
			}
			OnFailure(event, result.exception());
		});
}

void RequestEventProcessor::OnSuccess(const SealStreamEvent& event) {
	absl::MutexLock lock(&mutex_);
	attempts_.erase(StreamKey(event));
	stats_.completed++;
}

void RequestEventProcessor::OnFailure(const SealStreamEvent& event,
		const folly::exception_wrapper& ew) {
	const ErrorKind kind = ClassifyError(ew);
	const TaskDisposition disposition = DispositionForTaskFailure(kind);
	const std::string key = StreamKey(event);

	int attempt = 0;
	bool give_up = false;
	{
		absl::MutexLock lock(&mutex_);
		attempt = ++attempts_[key];
		give_up = options_.max_attempts > 0 && attempt >= options_.max_attempts;
		if (give_up) {
			attempts_.erase(key);
			stats_.dropped++;
		} else if (disposition == TaskDisposition::kPostpone) {
			stats_.postponed++;
		} else {
			stats_.retried++;
		}
	}

	if (give_up) {
		LOG(ERROR) << "Giving up on seal request for " << key << " after " << attempt
			<< " attempts, the stream is stuck. Last failure (" << kind << "): " << ew.what();
		Done();
		return;
	}

	const std::chrono::milliseconds backoff = BackoffFor(attempt);
	if (disposition == TaskDisposition::kPostpone) {
		VLOG(1) << "Postponing seal request for " << key << " by " << backoff.count()
			<< "ms (" << kind << ")";
	} else {
		LOG(WARNING) << "Seal request for " << key << " failed (attempt " << attempt
			<< "), retrying in " << backoff.count() << "ms: " << ew.what();
	}

	folly::futures::sleep(backoff, timekeeper_)
		.via(executor_.copy())
		.thenValue([this, event](folly::Unit) { return task_.WriteBack(event); })
		.thenTry([this, key](folly::Try<folly::Unit>&& written) {
			if (written.hasException()) {
				LOG(ERROR) << "Failed to write back seal request for " << key
					<< ", the request is lost: " << written.exception().what();
				absl::MutexLock lock(&mutex_);
				stats_.dropped++;
			}
			Done();
		});
}

void RequestEventProcessor::Done() {
	absl::MutexLock lock(&mutex_);
	in_flight_--;
}

std::chrono::milliseconds RequestEventProcessor::BackoffFor(int attempt) const {
	// attempt is 1-based; cap the shift so the multiplication cannot overflow
	const int shift = std::min(std::max(attempt - 1, 0), 20);
	const int64_t backoff = static_cast<int64_t>(options_.initial_backoff_ms) << shift;
	return std::chrono::milliseconds(std::min<int64_t>(backoff, options_.max_backoff_ms));
}

} // End of namespace Tidewater
