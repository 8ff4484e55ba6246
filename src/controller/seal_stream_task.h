#ifndef TIDEWATER_CONTROLLER_SEAL_STREAM_TASK_H_
#define TIDEWATER_CONTROLLER_SEAL_STREAM_TASK_H_

#include <string>
#include <vector>

#include <folly/Executor.h>
#include <folly/futures/Future.h>

#include "interfaces.h"
#include "store/stream_metadata_store.h"

namespace Tidewater {

/**
 * Request handler for SealStreamEvent.
 *
 * Runs once the stream is SEALING: nudges open transactions to abort, asks
 * the segment store to seal the active segments and records SEALED. Every
 * run re-reads the store, so redelivered or concurrent runs are safe.
 */
class SealStreamTask : public StreamTask<SealStreamEvent> {
	public:
		/**
		 * @param executor continuations of every run are scheduled here
		 */
		SealStreamTask(StreamMetadataStore& store,
				TransactionCoordinator& txn_coordinator,
				SegmentNotifier& segment_notifier,
				RequestEventWriter& event_writer,
				folly::Executor* executor);

		/**
		 * Fails with TaskStartException if the stream is not SEALING or
		 * SEALED yet, and with StoreException(kOperationNotAllowed) while
		 * transactions are active on the stream.
		 */
		folly::Future<folly::Unit> Execute(const SealStreamEvent& request) override;

		folly::Future<folly::Unit> WriteBack(const SealStreamEvent& event) override;

	private:
		/**
		 * Issue an abort for every OPEN transaction of the stream.
		 *
		 * @return true if the stream had no active transactions. False if it
		 * had any, whatever happened to the aborts.
		 */
		folly::Future<bool> AbortTransactions(const OperationContext& context,
				const std::string& scope, const std::string& stream);

		folly::Future<folly::Unit> NotifySealed(const std::string& scope, const std::string& stream,
				const OperationContext& context, const std::vector<Segment>& active_segments);

		folly::Future<folly::Unit> SetSealed(const std::string& scope, const std::string& stream,
				const OperationContext& context);

		StreamMetadataStore& store_;
		TransactionCoordinator& txn_coordinator_;
		SegmentNotifier& segment_notifier_;
		RequestEventWriter& event_writer_;
		folly::Executor::KeepAlive<> executor_;
};

} // End of namespace Tidewater

#endif // TIDEWATER_CONTROLLER_SEAL_STREAM_TASK_H_
