#include "error_classification.h"

#include "store/store_exception.h"
#include "task_exceptions.h"

namespace Tidewater {

ErrorKind ClassifyError(const folly::exception_wrapper& ew) {
	if (!ew) {
		return ErrorKind::kUnclassified;
	}
	if (ew.get_exception<TaskStartException>() != nullptr) {
		return ErrorKind::kNotStartedYet;
	}
	const StoreException* store_exception = ew.get_exception<StoreException>();
	if (store_exception == nullptr) {
		return ErrorKind::kUnclassified;
	}
	switch (store_exception->type()) {
		case StoreException::Type::kOperationNotAllowed: return ErrorKind::kOperationNotAllowed;
		case StoreException::Type::kIllegalState: return ErrorKind::kIllegalState;
		case StoreException::Type::kWriteConflict: return ErrorKind::kWriteConflict;
		case StoreException::Type::kDataNotFound: return ErrorKind::kDataNotFound;
		case StoreException::Type::kDataExists: return ErrorKind::kDataExists;
		case StoreException::Type::kConnectionError:
		case StoreException::Type::kUnknown:
			return ErrorKind::kUnclassified;
	}
	return ErrorKind::kUnclassified;
}

bool IsBenignAbortFailure(ErrorKind kind) {
	return kind == ErrorKind::kIllegalState ||
		kind == ErrorKind::kWriteConflict ||
		kind == ErrorKind::kDataNotFound;
}

AbortDisposition DispositionForAbortFailure(ErrorKind kind) {
	return IsBenignAbortFailure(kind) ? AbortDisposition::kAbsorbBenign
		: AbortDisposition::kAbsorbAndWarn;
}

TaskDisposition DispositionForTaskFailure(ErrorKind kind) {
	switch (kind) {
		case ErrorKind::kNotStartedYet:
		case ErrorKind::kOperationNotAllowed:
			return TaskDisposition::kPostpone;
		default:
			return TaskDisposition::kRetry;
	}
}

const char* ErrorKindName(ErrorKind kind) {
	switch (kind) {
		case ErrorKind::kNotStartedYet: return "NotStartedYet";
		case ErrorKind::kOperationNotAllowed: return "OperationNotAllowed";
		case ErrorKind::kIllegalState: return "IllegalState";
		case ErrorKind::kWriteConflict: return "WriteConflict";
		case ErrorKind::kDataNotFound: return "DataNotFound";
		case ErrorKind::kDataExists: return "DataExists";
		case ErrorKind::kUnclassified: return "Unclassified";
	}
	return "Unclassified";
}

} // End of namespace Tidewater
