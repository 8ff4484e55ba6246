#ifndef TIDEWATER_STORE_STORE_EXCEPTION_H_
#define TIDEWATER_STORE_STORE_EXCEPTION_H_

#include <stdexcept>
#include <string>

namespace Tidewater {

/**
 * Failure raised by a metadata store operation. The type tells callers
 * whether the failure is a known race they can absorb.
 */
class StoreException : public std::runtime_error {
	public:
		enum class Type {
			kDataExists,
			kDataNotFound,
			kWriteConflict,
			kIllegalState,
			kOperationNotAllowed,
			kConnectionError,
			kUnknown
		};

		StoreException(Type type, const std::string& message);

		Type type() const { return type_; }

		static const char* TypeName(Type type);

	private:
		Type type_;
};

} // End of namespace Tidewater

#endif // TIDEWATER_STORE_STORE_EXCEPTION_H_
