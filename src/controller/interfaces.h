#pragma once

#include <optional>
#include <string>
#include <vector>

#include <folly/Unit.h>
#include <folly/futures/Future.h>
#include <controller_events.pb.h>

#include "store/stream_types.h"

namespace Tidewater {

using SealStreamEvent = tidewater::controller::SealStreamEvent;

/**
 * Interface to the transaction lifecycle manager
 */
class TransactionCoordinator {
public:
	virtual ~TransactionCoordinator() = default;

	/**
	 * Request an abort. Resolves once the abort is recorded, not once the
	 * transaction is gone.
	 *
	 * @param version expected record version, or nullopt for any
	 * @return status of the transaction after the request
	 */
	virtual folly::Future<TxnStatus> AbortTxn(const std::string& scope, const std::string& stream,
			const TxnId& txn_id, std::optional<int32_t> version, const OperationContext& context) = 0;
};

/**
 * Interface to the storage tier for sealing segments
 */
class SegmentNotifier {
public:
	virtual ~SegmentNotifier() = default;

	virtual folly::Future<folly::Unit> SealSegments(const std::string& scope, const std::string& stream,
			const std::vector<int64_t>& segment_ids, const std::string& delegation_token) = 0;

	/// Token presented to the segment store. Empty when auth is off.
	virtual std::string RetrieveDelegationToken() = 0;
};

/**
 * Appends controller events to the request stream
 */
class RequestEventWriter {
public:
	virtual ~RequestEventWriter() = default;

	virtual folly::Future<folly::Unit> WriteEvent(const SealStreamEvent& event) = 0;
};

/**
 * Handler for one controller event type, run by the request processor.
 * Execute must be safe to run any number of times for the same event.
 */
template <typename Event>
class StreamTask {
public:
	virtual ~StreamTask() = default;

	virtual folly::Future<folly::Unit> Execute(const Event& event) = 0;

	/// Put the event back on the request stream for a later attempt.
	virtual folly::Future<folly::Unit> WriteBack(const Event& event) = 0;
};

} // namespace Tidewater
