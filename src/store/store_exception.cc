#include "store_exception.h"

namespace Tidewater {

StoreException::StoreException(Type type, const std::string& message)
	: std::runtime_error(std::string(TypeName(type)) + ": " + message),
	  type_(type) {}

const char* StoreException::TypeName(Type type) {
	switch (type) {
		case Type::kDataExists: return "DataExists";
		case Type::kDataNotFound: return "DataNotFound";
		case Type::kWriteConflict: return "WriteConflict";
		case Type::kIllegalState: return "IllegalState";
		case Type::kOperationNotAllowed: return "OperationNotAllowed";
		case Type::kConnectionError: return "ConnectionError";
		case Type::kUnknown: return "Unknown";
	}
	return "Unknown";
}

} // End of namespace Tidewater
