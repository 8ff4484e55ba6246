#include "stream_types.h"

namespace Tidewater {

const char* StateName(State state) {
	switch (state) {
		case State::kUnknown: return "UNKNOWN";
		case State::kCreating: return "CREATING";
		case State::kActive: return "ACTIVE";
		case State::kUpdating: return "UPDATING";
		case State::kScaling: return "SCALING";
		case State::kTruncating: return "TRUNCATING";
		case State::kSealing: return "SEALING";
		case State::kSealed: return "SEALED";
	}
	return "INVALID";
}

const char* TxnStatusName(TxnStatus status) {
	switch (status) {
		case TxnStatus::kOpen: return "OPEN";
		case TxnStatus::kCommitting: return "COMMITTING";
		case TxnStatus::kAborting: return "ABORTING";
		case TxnStatus::kCommitted: return "COMMITTED";
		case TxnStatus::kAborted: return "ABORTED";
	}
	return "INVALID";
}

bool IsTransitionAllowed(State from, State to) {
	switch (from) {
		case State::kUnknown:
			return to == State::kCreating;
		case State::kCreating:
			return to == State::kActive;
		case State::kActive:
			return to == State::kUpdating || to == State::kScaling ||
				to == State::kTruncating || to == State::kSealing;
		case State::kUpdating:
		case State::kScaling:
		case State::kTruncating:
			return to == State::kActive;
		case State::kSealing:
			return to == State::kSealing || to == State::kSealed;
		case State::kSealed:
			return to == State::kSealed;
	}
	return false;
}

} // End of namespace Tidewater
