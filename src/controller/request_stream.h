#ifndef TIDEWATER_CONTROLLER_REQUEST_STREAM_H_
#define TIDEWATER_CONTROLLER_REQUEST_STREAM_H_

#include <optional>
#include <string>

#include "folly/MPMCQueue.h"

#include "interfaces.h"

namespace Tidewater {

/**
 * In-process request stream. Events are kept serialized, the way they sit
 * in the durable stream, and read back in FIFO order.
 */
class RequestStream : public RequestEventWriter {
	public:
		explicit RequestStream(size_t capacity);

		/// Fails with StoreException(kConnectionError) when the stream is full.
		folly::Future<folly::Unit> WriteEvent(const SealStreamEvent& event) override;

		/**
		 * Blocks until an event is available. Returns nullopt once Close has
		 * been called and everything before it has been read. Entries that do
		 * not parse are logged and skipped.
		 */
		std::optional<SealStreamEvent> Read();

		/// Wakes one blocked reader with end of stream.
		void Close();

		size_t Size() const;

	private:
		folly::MPMCQueue<std::optional<std::string>> queue_;
};

} // End of namespace Tidewater

#endif // TIDEWATER_CONTROLLER_REQUEST_STREAM_H_
