#pragma once

#include <optional>
#include <string>
#include <vector>

#include <folly/Unit.h>
#include <folly/futures/Future.h>

#include "stream_types.h"

namespace Tidewater {

/**
 * Interface to the stream metadata store.
 *
 * Every operation completes asynchronously. Failures are delivered through
 * the returned future as StoreException.
 */
class StreamMetadataStore {
public:
	virtual ~StreamMetadataStore() = default;

	virtual OperationContext CreateContext(const std::string& scope, const std::string& stream) = 0;

	virtual folly::Future<State> GetState(const std::string& scope, const std::string& stream,
			const OperationContext& context) = 0;

	virtual folly::Future<folly::Unit> SetState(const std::string& scope, const std::string& stream,
			State state, const OperationContext& context) = 0;

	/// Segments currently open for writes, ordered by segment number.
	/// Empty once the stream is sealed.
	virtual folly::Future<std::vector<Segment>> GetActiveSegments(const std::string& scope,
			const std::string& stream, const OperationContext& context) = 0;

	virtual folly::Future<ActiveTxnMap> GetActiveTxns(const std::string& scope,
			const std::string& stream, const OperationContext& context) = 0;

	/// Moves the stream to SEALED. Succeeds without effect on a sealed stream.
	virtual folly::Future<folly::Unit> SetSealed(const std::string& scope, const std::string& stream,
			const OperationContext& context) = 0;

	virtual folly::Future<folly::Unit> CreateTransaction(const std::string& scope,
			const std::string& stream, const TxnId& txn_id, const OperationContext& context) = 0;

	/**
	 * Starts completing a transaction: OPEN moves to COMMITTING or ABORTING.
	 *
	 * @param commit true to commit, false to abort
	 * @param version expected record version, or nullopt to skip the check
	 * @return status of the record after the call
	 */
	virtual folly::Future<TxnStatus> SealTransaction(const std::string& scope,
			const std::string& stream, const TxnId& txn_id, bool commit,
			std::optional<int32_t> version, const OperationContext& context) = 0;
};

} // namespace Tidewater
