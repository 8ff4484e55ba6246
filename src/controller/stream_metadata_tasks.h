#ifndef TIDEWATER_CONTROLLER_STREAM_METADATA_TASKS_H_
#define TIDEWATER_CONTROLLER_STREAM_METADATA_TASKS_H_

#include <atomic>
#include <string>

#include <folly/Executor.h>

#include "interfaces.h"
#include "store/stream_metadata_store.h"

namespace Tidewater {

/**
 * Controller entry points that change stream lifecycle state.
 */
class StreamMetadataTasks {
	public:
		StreamMetadataTasks(StreamMetadataStore& store, RequestEventWriter& event_writer,
				folly::Executor* executor);

		/**
		 * Post a seal request and move the stream to SEALING. The seal task
		 * does the rest asynchronously; poll IsSealed for completion.
		 *
		 * The event is written before the state changes, so the task may see
		 * the stream before it is SEALING and postpone itself.
		 */
		folly::Future<folly::Unit> SealStream(const std::string& scope, const std::string& stream);

		folly::Future<bool> IsSealed(const std::string& scope, const std::string& stream);

	private:
		StreamMetadataStore& store_;
		RequestEventWriter& event_writer_;
		folly::Executor::KeepAlive<> executor_;
		std::atomic<int64_t> next_request_id_{0};
};

} // End of namespace Tidewater

#endif // TIDEWATER_CONTROLLER_STREAM_METADATA_TASKS_H_
