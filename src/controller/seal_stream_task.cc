#include "seal_stream_task.h"

#include <glog/logging.h>
#include <folly/futures/Future.h>

#include "error_classification.h"
#include "store/store_exception.h"
#include "task_exceptions.h"

namespace Tidewater {

SealStreamTask::SealStreamTask(StreamMetadataStore& store,
		TransactionCoordinator& txn_coordinator,
		SegmentNotifier& segment_notifier,
		RequestEventWriter& event_writer,
		folly::Executor* executor)
	: store_(store),
	  txn_coordinator_(txn_coordinator),
	  segment_notifier_(segment_notifier),
	  event_writer_(event_writer),
	  executor_(folly::getKeepAliveToken(executor)) {
	CHECK(executor != nullptr) << "SealStreamTask needs an executor";
}

folly::Future<folly::Unit> SealStreamTask::Execute(const SealStreamEvent& request) {
	const std::string scope = request.scope();
	const std::string stream = request.stream();
	const OperationContext context = store_.CreateContext(scope, stream);

	// Sealing is processed only once the stream is SEALING or SEALED, otherwise postpone.
	return store_.GetState(scope, stream, context).via(executor_.copy())
		.thenValue([scope, stream](State state) {
			if (state != State::kSealing && state != State::kSealed) {
				throw TaskStartException("Seal stream task not started yet for " +
						scope + "/" + stream + ", state " + StateName(state));
			}
		})
		.thenValue([this, scope, stream, context](folly::Unit) {
			return AbortTransactions(context, scope, stream);
		})
		.thenValue([scope, stream](bool no_transactions) {
			if (!no_transactions) {
				// Throwing OperationNotAllowed makes the request processor repost the event.
				VLOG(1) << "Found open transactions on stream " << scope << "/" << stream
					<< ". Postponing its sealing.";
				throw StoreException(StoreException::Type::kOperationNotAllowed,
						"Found ongoing transactions. Abort transaction requested. "
						"Sealing stream segments should wait until transactions are aborted.");
			}
		})
		.thenValue([this, scope, stream, context](folly::Unit) {
			return store_.GetActiveSegments(scope, stream, context);
		})
		.thenValue([this, scope, stream, context](std::vector<Segment> active_segments)
				-> folly::Future<folly::Unit> {
			if (active_segments.empty()) {
				// An empty active set means a previous run already sealed the
				// stream. Do not touch the state again.
				VLOG(1) << "Stream " << scope << "/" << stream << " is already sealed";
				return folly::makeFuture();
			}
			return NotifySealed(scope, stream, context, active_segments);
		});
}

folly::Future<bool> SealStreamTask::AbortTransactions(const OperationContext& context,
		const std::string& scope, const std::string& stream) {
	return store_.GetActiveTxns(scope, stream, context).via(executor_.copy())
		.thenValue([this, context, scope, stream](ActiveTxnMap active_txns) -> folly::Future<bool> {
			if (active_txns.empty()) {
				return folly::makeFuture(true);
			}

			std::vector<folly::Future<folly::Unit>> aborts;
			for (const auto& [txn_id, record] : active_txns) {
				if (record.status != TxnStatus::kOpen) {
					continue;
				}
				// A coordinator that throws instead of failing the future must not
				// stop the aborts after it.
				aborts.push_back(folly::makeFutureWith([this, &scope, &stream, &txn_id, &context]() {
						return txn_coordinator_.AbortTxn(scope, stream, txn_id, std::nullopt, context);
					})
					.via(executor_.copy())
					.thenValue([](TxnStatus) {})
					.thenError([scope, stream, txn_id = txn_id](folly::exception_wrapper&& ew) {
						const ErrorKind kind = ClassifyError(ew);
						if (DispositionForAbortFailure(kind) == AbortDisposition::kAbsorbBenign) {
							// IllegalState: the transaction is already being completed.
							// WriteConflict: another thread is updating the transaction record.
							// DataNotFound: the record was cleaned up after we listed it.
							VLOG(1) << "A known exception (" << kind << ") thrown during seal stream "
								<< "while trying to abort transaction " << txn_id << " on stream "
								<< scope << "/" << stream << ": " << ew.what();
						} else {
							// Absorbed too: since transactions were found, the event is
							// reposted and the next run aborts whatever is still open.
							LOG(WARNING) << "Exception thrown during seal stream while trying to abort "
								<< "transaction " << txn_id << " on stream " << scope << "/" << stream
								<< ": " << ew.what();
						}
					}));
			}

			VLOG(2) << "Requested abort of " << aborts.size() << " of " << active_txns.size()
				<< " active transactions on stream " << scope << "/" << stream;
			return folly::collectAll(aborts.begin(), aborts.end()).via(executor_.copy())
				.thenValue([](std::vector<folly::Try<folly::Unit>>) { return false; });
		});
}

folly::Future<folly::Unit> SealStreamTask::NotifySealed(const std::string& scope,
		const std::string& stream, const OperationContext& context,
		const std::vector<Segment>& active_segments) {
	std::vector<int64_t> segments_to_be_sealed;
	segments_to_be_sealed.reserve(active_segments.size());
	for (const Segment& segment : active_segments) {
		segments_to_be_sealed.push_back(segment.number);
	}

	VLOG(1) << "Sending notification to segment store to seal " << segments_to_be_sealed.size()
		<< " segments for stream " << scope << "/" << stream;
	return segment_notifier_.SealSegments(scope, stream, segments_to_be_sealed,
			segment_notifier_.RetrieveDelegationToken())
		.via(executor_.copy())
		.thenValue([this, scope, stream, context](folly::Unit) {
			return SetSealed(scope, stream, context);
		});
}

folly::Future<folly::Unit> SealStreamTask::SetSealed(const std::string& scope,
		const std::string& stream, const OperationContext& context) {
	return store_.SetSealed(scope, stream, context).via(executor_.copy())
		.thenValue([scope, stream](folly::Unit) {
			LOG(INFO) << "Stream " << scope << "/" << stream << " sealed";
		});
}

folly::Future<folly::Unit> SealStreamTask::WriteBack(const SealStreamEvent& event) {
	return event_writer_.WriteEvent(event);
}

} // End of namespace Tidewater
