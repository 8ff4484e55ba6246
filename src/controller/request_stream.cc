#include "request_stream.h"

#include <glog/logging.h>

#include "store/store_exception.h"

namespace Tidewater {

RequestStream::RequestStream(size_t capacity) : queue_(capacity) {}

folly::Future<folly::Unit> RequestStream::WriteEvent(const SealStreamEvent& event) {
	std::string payload;
	if (!event.SerializeToString(&payload)) {
		return folly::makeFuture<folly::Unit>(StoreException(StoreException::Type::kUnknown,
					"Failed to serialize seal event for " + event.scope() + "/" + event.stream()));
	}
	if (!queue_.write(std::optional<std::string>(std::move(payload)))) {
		LOG(ERROR) << "Request stream full, dropping write of " << event.scope() << "/" << event.stream();
		return folly::makeFuture<folly::Unit>(StoreException(StoreException::Type::kConnectionError,
					"Request stream is full"));
	}
	VLOG(3) << "Wrote seal event for " << event.scope() << "/" << event.stream();
	return folly::makeFuture();
}

std::optional<SealStreamEvent> RequestStream::Read() {
	while (true) {
		std::optional<std::string> payload;
		queue_.blockingRead(payload);
		if (!payload.has_value()) {
			return std::nullopt;
		}
		SealStreamEvent event;
		if (event.ParseFromString(payload.value())) {
			return event;
		}
		LOG(ERROR) << "Skipping request stream entry that is not a seal event ("
			<< payload->size() << " bytes)";
	}
}

void RequestStream::Close() {
	queue_.blockingWrite(std::nullopt);
}

size_t RequestStream::Size() const {
	ssize_t size = queue_.size();
	return size > 0 ? static_cast<size_t>(size) : 0;
}

} // End of namespace Tidewater
