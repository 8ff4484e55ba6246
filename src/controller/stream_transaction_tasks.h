#ifndef TIDEWATER_CONTROLLER_STREAM_TRANSACTION_TASKS_H_
#define TIDEWATER_CONTROLLER_STREAM_TRANSACTION_TASKS_H_

#include <mutex>
#include <random>
#include <string>

#include <folly/Executor.h>

#include "interfaces.h"
#include "store/stream_metadata_store.h"

namespace Tidewater {

/**
 * Transaction lifecycle operations backed by the metadata store.
 *
 * Commit and abort only record the decision (COMMITTING / ABORTING). The
 * transaction processors finish the work and drop the record.
 */
class StreamTransactionTasks : public TransactionCoordinator {
	public:
		StreamTransactionTasks(StreamMetadataStore& store, folly::Executor* executor);

		/// Opens a transaction and resolves to its id.
		folly::Future<TxnId> CreateTxn(const std::string& scope, const std::string& stream,
				const OperationContext& context);

		folly::Future<TxnStatus> CommitTxn(const std::string& scope, const std::string& stream,
				const TxnId& txn_id, std::optional<int32_t> version, const OperationContext& context);

		folly::Future<TxnStatus> AbortTxn(const std::string& scope, const std::string& stream,
				const TxnId& txn_id, std::optional<int32_t> version,
				const OperationContext& context) override;

	private:
		folly::Future<TxnStatus> SealTxn(const std::string& scope, const std::string& stream,
				const TxnId& txn_id, bool commit, std::optional<int32_t> version,
				const OperationContext& context);

		TxnId NewTxnId();

		StreamMetadataStore& store_;
		folly::Executor::KeepAlive<> executor_;
		std::mutex rng_mutex_;
		std::mt19937_64 random_engine_;
};

} // End of namespace Tidewater

#endif // TIDEWATER_CONTROLLER_STREAM_TRANSACTION_TASKS_H_
