#ifndef TIDEWATER_CONTROLLER_ERROR_CLASSIFICATION_H_
#define TIDEWATER_CONTROLLER_ERROR_CLASSIFICATION_H_

#include <ostream>

#include <folly/ExceptionWrapper.h>

namespace Tidewater {

/**
 * Closed set of failure kinds the controller tasks distinguish.
 */
enum class ErrorKind {
	kNotStartedYet,
	kOperationNotAllowed,
	kIllegalState,
	kWriteConflict,
	kDataNotFound,
	// Raised by CreateStream and CreateTransaction. Never benign during an
	// abort sweep; a task failing with it is retried.
	kDataExists,
	kUnclassified
};

/// What a transaction sweep does with a failed abort request.
/// Neither choice fails the sweep.
enum class AbortDisposition {
	kAbsorbBenign,
	kAbsorbAndWarn
};

/// What the dispatcher does with a failed task execution.
enum class TaskDisposition {
	kPostpone,
	kRetry
};

/// Maps a failure to its kind. Anything that is not a TaskStartException
/// or a StoreException of a known type is unclassified.
ErrorKind ClassifyError(const folly::exception_wrapper& ew);

/// IllegalState, WriteConflict and DataNotFound mean some other process
/// already owns or resolved the transaction.
bool IsBenignAbortFailure(ErrorKind kind);

AbortDisposition DispositionForAbortFailure(ErrorKind kind);

TaskDisposition DispositionForTaskFailure(ErrorKind kind);

const char* ErrorKindName(ErrorKind kind);

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
	return os << ErrorKindName(kind);
}

} // End of namespace Tidewater

#endif // TIDEWATER_CONTROLLER_ERROR_CLASSIFICATION_H_
