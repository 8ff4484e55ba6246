#ifndef TIDEWATER_CONTROLLER_TASK_EXCEPTIONS_H_
#define TIDEWATER_CONTROLLER_TASK_EXCEPTIONS_H_

#include <stdexcept>
#include <string>

namespace Tidewater {

/**
 * A request was picked up before the state change that makes it runnable
 * became visible in the metadata store. The request is postponed.
 */
class TaskStartException : public std::runtime_error {
	public:
		explicit TaskStartException(const std::string& message)
			: std::runtime_error(message) {}
};

/**
 * The segment store rejected or failed a call.
 */
class SegmentStoreRpcException : public std::runtime_error {
	public:
		SegmentStoreRpcException(int status_code, const std::string& message)
			: std::runtime_error(message), status_code_(status_code) {}

		/// grpc::StatusCode of the failed call, 0 when the call itself succeeded
		/// but the segment store reported failure.
		int status_code() const { return status_code_; }

	private:
		int status_code_;
};

} // End of namespace Tidewater

#endif // TIDEWATER_CONTROLLER_TASK_EXCEPTIONS_H_
