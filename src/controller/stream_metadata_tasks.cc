#include "stream_metadata_tasks.h"

#include <glog/logging.h>

namespace Tidewater {

StreamMetadataTasks::StreamMetadataTasks(StreamMetadataStore& store,
		RequestEventWriter& event_writer, folly::Executor* executor)
	: store_(store),
	  event_writer_(event_writer),
	  executor_(folly::getKeepAliveToken(executor)) {
	CHECK(executor != nullptr) << "StreamMetadataTasks needs an executor";
}

folly::Future<folly::Unit> StreamMetadataTasks::SealStream(const std::string& scope,
		const std::string& stream) {
	const OperationContext context = store_.CreateContext(scope, stream);
	SealStreamEvent event;
	event.set_scope(scope);
	event.set_stream(stream);
	event.set_request_id(next_request_id_.fetch_add(1) + 1);

	return event_writer_.WriteEvent(event).via(executor_.copy())
		.thenValue([this, scope, stream, context](folly::Unit) {
			return store_.GetState(scope, stream, context);
		})
		.thenValue([this, scope, stream, context](State state) -> folly::Future<folly::Unit> {
			if (state == State::kSealed) {
				return folly::makeFuture();
			}
			LOG(INFO) << "Sealing stream " << scope << "/" << stream;
			return store_.SetState(scope, stream, State::kSealing, context);
		});
}

folly::Future<bool> StreamMetadataTasks::IsSealed(const std::string& scope,
		const std::string& stream) {
	const OperationContext context = store_.CreateContext(scope, stream);
	return store_.GetState(scope, stream, context).via(executor_.copy())
		.thenValue([](State state) { return state == State::kSealed; });
}

} // End of namespace Tidewater
