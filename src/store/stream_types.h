#ifndef TIDEWATER_STORE_STREAM_TYPES_H_
#define TIDEWATER_STORE_STREAM_TYPES_H_

#include <cstdint>
#include <ostream>
#include <string>

#include "absl/container/flat_hash_map.h"

namespace Tidewater {

/**
 * Lifecycle state of a stream as recorded in the metadata store
 */
enum class State {
	kUnknown,
	kCreating,
	kActive,
	kUpdating,
	kScaling,
	kTruncating,
	kSealing,
	kSealed
};

enum class TxnStatus {
	kOpen,
	kCommitting,
	kAborting,
	kCommitted,
	kAborted
};

struct Segment {
	int64_t number;
	int64_t start_time;
	double key_start;
	double key_end;
};

struct ActiveTxnRecord {
	TxnStatus status;
	int32_t version;
};

using TxnId = std::string;
using ActiveTxnMap = absl::flat_hash_map<TxnId, ActiveTxnRecord>;

/**
 * Correlation handle for one workflow run against the metadata store.
 * Created per execution, never reused across runs.
 */
struct OperationContext {
	std::string scope;
	std::string stream;
	uint64_t id;
};

const char* StateName(State state);
const char* TxnStatusName(TxnStatus status);

/**
 * Whether the metadata store may move a stream from `from` to `to`.
 * Re-writing SEALING or SEALED is allowed so that retried runs succeed.
 */
bool IsTransitionAllowed(State from, State to);

inline std::ostream& operator<<(std::ostream& os, State state) {
	return os << StateName(state);
}

inline std::ostream& operator<<(std::ostream& os, TxnStatus status) {
	return os << TxnStatusName(status);
}

inline std::ostream& operator<<(std::ostream& os, const OperationContext& context) {
	return os << context.scope << "/" << context.stream << "#" << context.id;
}

} // End of namespace Tidewater

#endif // TIDEWATER_STORE_STREAM_TYPES_H_
