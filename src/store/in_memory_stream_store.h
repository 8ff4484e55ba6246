#ifndef TIDEWATER_STORE_IN_MEMORY_STREAM_STORE_H_
#define TIDEWATER_STORE_IN_MEMORY_STREAM_STORE_H_

#include <atomic>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include <folly/Executor.h>
#include <glog/logging.h>

#include "stream_metadata_store.h"
#include "store_exception.h"

namespace Tidewater {

/**
 * Metadata store kept in process memory.
 *
 * Records carry versions that are bumped on every write so callers can do
 * optimistic updates. All operations run on the executor handed to the
 * constructor.
 */
class InMemoryStreamStore : public StreamMetadataStore {
	public:
		explicit InMemoryStreamStore(folly::Executor* executor);
		~InMemoryStreamStore() override {
			VLOG(3) << "\t[InMemoryStreamStore]\tDestructed";
		}

		OperationContext CreateContext(const std::string& scope, const std::string& stream) override;

		/**
		 * Create a stream in ACTIVE state with `num_segments` segments that
		 * evenly split the key space.
		 */
		folly::Future<folly::Unit> CreateStream(const std::string& scope,
				const std::string& stream, int num_segments);

		folly::Future<State> GetState(const std::string& scope, const std::string& stream,
				const OperationContext& context) override;

		folly::Future<folly::Unit> SetState(const std::string& scope, const std::string& stream,
				State state, const OperationContext& context) override;

		folly::Future<std::vector<Segment>> GetActiveSegments(const std::string& scope,
				const std::string& stream, const OperationContext& context) override;

		folly::Future<ActiveTxnMap> GetActiveTxns(const std::string& scope,
				const std::string& stream, const OperationContext& context) override;

		folly::Future<folly::Unit> SetSealed(const std::string& scope, const std::string& stream,
				const OperationContext& context) override;

		folly::Future<folly::Unit> CreateTransaction(const std::string& scope,
				const std::string& stream, const TxnId& txn_id,
				const OperationContext& context) override;

		folly::Future<TxnStatus> SealTransaction(const std::string& scope,
				const std::string& stream, const TxnId& txn_id, bool commit,
				std::optional<int32_t> version, const OperationContext& context) override;

		/**
		 * Drop a transaction that finished committing or aborting. This is
		 * what the transaction processors do once the segment store has
		 * merged or discarded the transaction's data.
		 */
		folly::Future<folly::Unit> CompleteTransaction(const std::string& scope,
				const std::string& stream, const TxnId& txn_id);

		/// Number of mutating calls that changed a record.
		size_t WriteCount() const { return write_count_.load(); }

	private:
		struct StreamRecord {
			State state;
			int32_t version;
			std::vector<Segment> active_segments;
			ActiveTxnMap active_txns;
		};

		static std::string StreamKey(const std::string& scope, const std::string& stream) {
			return scope + "/" + stream;
		}

		// Requires mutex_ held. Throws DataNotFound.
		StreamRecord& GetRecordLocked(const std::string& scope, const std::string& stream)
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

		folly::Executor::KeepAlive<> executor_;
		absl::Mutex mutex_;
		absl::flat_hash_map<std::string, StreamRecord> streams_ ABSL_GUARDED_BY(mutex_);
		std::atomic<uint64_t> next_context_id_{0};
		std::atomic<size_t> write_count_{0};
};

} // End of namespace Tidewater

#endif // TIDEWATER_STORE_IN_MEMORY_STREAM_STORE_H_
