#include "stream_transaction_tasks.h"

#include <glog/logging.h>
#include "absl/strings/str_format.h"

namespace Tidewater {

StreamTransactionTasks::StreamTransactionTasks(StreamMetadataStore& store, folly::Executor* executor)
	: store_(store),
	  executor_(folly::getKeepAliveToken(executor)),
	  random_engine_(std::random_device{}()) {
	CHECK(executor != nullptr) << "StreamTransactionTasks needs an executor";
}

TxnId StreamTransactionTasks::NewTxnId() {
	std::lock_guard<std::mutex> lock(rng_mutex_);
	const uint64_t high = random_engine_();
	const uint64_t low = random_engine_();
	return absl::StrFormat("%016x%016x", high, low);
}

folly::Future<TxnId> StreamTransactionTasks::CreateTxn(const std::string& scope,
		const std::string& stream, const OperationContext& context) {
	TxnId txn_id = NewTxnId();
	return store_.CreateTransaction(scope, stream, txn_id, context).via(executor_.copy())
		.thenValue([scope, stream, txn_id](folly::Unit) {
			VLOG(2) << "Created transaction " << txn_id << " on stream " << scope << "/" << stream;
			return txn_id;
		});
}

folly::Future<TxnStatus> StreamTransactionTasks::CommitTxn(const std::string& scope,
		const std::string& stream, const TxnId& txn_id, std::optional<int32_t> version,
		const OperationContext& context) {
	return SealTxn(scope, stream, txn_id, true, version, context);
}

folly::Future<TxnStatus> StreamTransactionTasks::AbortTxn(const std::string& scope,
		const std::string& stream, const TxnId& txn_id, std::optional<int32_t> version,
		const OperationContext& context) {
	return SealTxn(scope, stream, txn_id, false, version, context);
}

folly::Future<TxnStatus> StreamTransactionTasks::SealTxn(const std::string& scope,
		const std::string& stream, const TxnId& txn_id, bool commit,
		std::optional<int32_t> version, const OperationContext& context) {
	return store_.SealTransaction(scope, stream, txn_id, commit, version, context)
		.via(executor_.copy())
		.thenValue([scope, stream, txn_id, commit](TxnStatus status) {
			VLOG(2) << (commit ? "Commit" : "Abort") << " of transaction " << txn_id
				<< " on stream " << scope << "/" << stream << " recorded, status " << status;
			return status;
		});
}

} // End of namespace Tidewater
