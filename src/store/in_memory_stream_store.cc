#include "in_memory_stream_store.h"

#include <chrono>

#include "absl/strings/str_cat.h"
#include <folly/futures/Future.h>

namespace Tidewater {

InMemoryStreamStore::InMemoryStreamStore(folly::Executor* executor)
	: executor_(folly::getKeepAliveToken(executor)) {
	CHECK(executor != nullptr) << "InMemoryStreamStore needs an executor";
	VLOG(3) << "\t[InMemoryStreamStore]\tConstructed";
}

OperationContext InMemoryStreamStore::CreateContext(const std::string& scope,
		const std::string& stream) {
	return OperationContext{scope, stream, next_context_id_.fetch_add(1) + 1};
}

InMemoryStreamStore::StreamRecord& InMemoryStreamStore::GetRecordLocked(
		const std::string& scope, const std::string& stream) {
	auto it = streams_.find(StreamKey(scope, stream));
	if (it == streams_.end()) {
		throw StoreException(StoreException::Type::kDataNotFound,
				"Stream " + StreamKey(scope, stream) + " not found");
	}
	return it->second;
}

folly::Future<folly::Unit> InMemoryStreamStore::CreateStream(const std::string& scope,
		const std::string& stream, int num_segments) {
	return folly::via(executor_.copy(), [this, scope, stream, num_segments]() {
		if (num_segments < 1) {
			throw StoreException(StoreException::Type::kIllegalState,
					"Stream needs at least one segment");
		}
		const int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
				std::chrono::system_clock::now().time_since_epoch()).count();

		StreamRecord record{State::kActive, 0, {}, {}};
		const double width = 1.0 / num_segments;
		for (int i = 0; i < num_segments; i++) {
			const double key_end = (i == num_segments - 1) ? 1.0 : width * (i + 1);
			record.active_segments.push_back(Segment{i, now, width * i, key_end});
		}

		absl::MutexLock lock(&mutex_);
		auto [it, inserted] = streams_.try_emplace(StreamKey(scope, stream), std::move(record));
		if (!inserted) {
			throw StoreException(StoreException::Type::kDataExists,
					"Stream " + StreamKey(scope, stream) + " already exists");
		}
		write_count_++;
		VLOG(2) << "Created stream " << scope << "/" << stream << " with "
			<< num_segments << " segments";
	});
}

folly::Future<State> InMemoryStreamStore::GetState(const std::string& scope,
		const std::string& stream, const OperationContext& context) {
	return folly::via(executor_.copy(), [this, scope, stream, context]() {
		absl::MutexLock lock(&mutex_);
		const State state = GetRecordLocked(scope, stream).state;
		VLOG(3) << "[" << context << "] state " << state;
		return state;
	});
}

folly::Future<folly::Unit> InMemoryStreamStore::SetState(const std::string& scope,
		const std::string& stream, State state, const OperationContext& context) {
	return folly::via(executor_.copy(), [this, scope, stream, state, context]() {
		absl::MutexLock lock(&mutex_);
		StreamRecord& record = GetRecordLocked(scope, stream);
		if (record.state == state &&
				(state == State::kSealing || state == State::kSealed)) {
			return;
		}
		if (!IsTransitionAllowed(record.state, state)) {
			throw StoreException(StoreException::Type::kIllegalState,
					absl::StrCat("Cannot move ", StreamKey(scope, stream), " from ",
						StateName(record.state), " to ", StateName(state)));
		}
		VLOG(2) << "[" << context << "] " << record.state << " -> " << state;
		record.state = state;
		// A sealed stream has no active segments, whichever call sealed it
		if (state == State::kSealed) {
			record.active_segments.clear();
		}
		record.version++;
		write_count_++;
	});
}

folly::Future<std::vector<Segment>> InMemoryStreamStore::GetActiveSegments(
		const std::string& scope, const std::string& stream, const OperationContext& context) {
	return folly::via(executor_.copy(), [this, scope, stream, context]() {
		absl::MutexLock lock(&mutex_);
		std::vector<Segment> segments = GetRecordLocked(scope, stream).active_segments;
		VLOG(3) << "[" << context << "] " << segments.size() << " active segments";
		return segments;
	});
}

folly::Future<ActiveTxnMap> InMemoryStreamStore::GetActiveTxns(const std::string& scope,
		const std::string& stream, const OperationContext& context) {
	return folly::via(executor_.copy(), [this, scope, stream, context]() {
		absl::MutexLock lock(&mutex_);
		ActiveTxnMap txns = GetRecordLocked(scope, stream).active_txns;
		VLOG(3) << "[" << context << "] " << txns.size() << " active transactions";
		return txns;
	});
}

folly::Future<folly::Unit> InMemoryStreamStore::SetSealed(const std::string& scope,
		const std::string& stream, const OperationContext& context) {
	return folly::via(executor_.copy(), [this, scope, stream, context]() {
		absl::MutexLock lock(&mutex_);
		StreamRecord& record = GetRecordLocked(scope, stream);
		if (record.state == State::kSealed) {
			VLOG(2) << "[" << context << "] already sealed";
			return;
		}
		if (!IsTransitionAllowed(record.state, State::kSealed)) {
			throw StoreException(StoreException::Type::kIllegalState,
					absl::StrCat("Cannot seal ", StreamKey(scope, stream), " in state ",
						StateName(record.state)));
		}
		record.state = State::kSealed;
		record.active_segments.clear();
		record.version++;
		write_count_++;
		VLOG(1) << "[" << context << "] stream sealed";
	});
}

folly::Future<folly::Unit> InMemoryStreamStore::CreateTransaction(const std::string& scope,
		const std::string& stream, const TxnId& txn_id, const OperationContext& context) {
	return folly::via(executor_.copy(), [this, scope, stream, txn_id, context]() {
		absl::MutexLock lock(&mutex_);
		StreamRecord& record = GetRecordLocked(scope, stream);
		if (record.state != State::kActive) {
			throw StoreException(StoreException::Type::kOperationNotAllowed,
					absl::StrCat("Cannot open a transaction on ", StreamKey(scope, stream),
						" in state ", StateName(record.state)));
		}
		auto [it, inserted] = record.active_txns.try_emplace(txn_id,
				ActiveTxnRecord{TxnStatus::kOpen, 0});
		if (!inserted) {
			throw StoreException(StoreException::Type::kDataExists,
					"Transaction " + txn_id + " already exists");
		}
		write_count_++;
		VLOG(2) << "[" << context << "] opened transaction " << txn_id;
	});
}

folly::Future<TxnStatus> InMemoryStreamStore::SealTransaction(const std::string& scope,
		const std::string& stream, const TxnId& txn_id, bool commit,
		std::optional<int32_t> version, const OperationContext& context) {
	return folly::via(executor_.copy(), [this, scope, stream, txn_id, commit, version, context]() {
		absl::MutexLock lock(&mutex_);
		StreamRecord& record = GetRecordLocked(scope, stream);
		auto it = record.active_txns.find(txn_id);
		if (it == record.active_txns.end()) {
			throw StoreException(StoreException::Type::kDataNotFound,
					"Transaction " + txn_id + " not found on " + StreamKey(scope, stream));
		}
		ActiveTxnRecord& txn = it->second;
		if (version.has_value() && version.value() != txn.version) {
			throw StoreException(StoreException::Type::kWriteConflict,
					absl::StrCat("Transaction ", txn_id, " is at version ", txn.version,
						", expected ", version.value()));
		}

		const TxnStatus target = commit ? TxnStatus::kCommitting : TxnStatus::kAborting;
		const TxnStatus done = commit ? TxnStatus::kCommitted : TxnStatus::kAborted;
		if (txn.status == target || txn.status == done) {
			return txn.status;
		}
		if (txn.status != TxnStatus::kOpen) {
			throw StoreException(StoreException::Type::kIllegalState,
					absl::StrCat("Transaction ", txn_id, " is ", TxnStatusName(txn.status),
						", cannot move to ", TxnStatusName(target)));
		}
		txn.status = target;
		txn.version++;
		write_count_++;
		VLOG(2) << "[" << context << "] transaction " << txn_id << " -> " << target;
		return target;
	});
}

folly::Future<folly::Unit> InMemoryStreamStore::CompleteTransaction(const std::string& scope,
		const std::string& stream, const TxnId& txn_id) {
	return folly::via(executor_.copy(), [this, scope, stream, txn_id]() {
		absl::MutexLock lock(&mutex_);
		StreamRecord& record = GetRecordLocked(scope, stream);
		auto it = record.active_txns.find(txn_id);
		if (it == record.active_txns.end()) {
			throw StoreException(StoreException::Type::kDataNotFound,
					"Transaction " + txn_id + " not found on " + StreamKey(scope, stream));
		}
		if (it->second.status == TxnStatus::kOpen) {
			throw StoreException(StoreException::Type::kIllegalState,
					"Transaction " + txn_id + " is still open");
		}
		record.active_txns.erase(it);
		write_count_++;
	});
}

} // End of namespace Tidewater
