#ifndef TIDEWATER_CONTROLLER_GRPC_SEGMENT_NOTIFIER_H_
#define TIDEWATER_CONTROLLER_GRPC_SEGMENT_NOTIFIER_H_

#include <atomic>
#include <memory>
#include <string>

#include <folly/Executor.h>
#include <grpcpp/grpcpp.h>
#include <segment_store.grpc.pb.h>

#include "interfaces.h"

namespace Tidewater {

/**
 * SegmentNotifier that talks to the segment store over gRPC.
 *
 * Calls use the callback API so no thread waits for the reply. There is no
 * retry and no deadline here: a failed call fails the seal task, which the
 * request processor retries as a whole.
 */
class GrpcSegmentNotifier : public SegmentNotifier {
	public:
		GrpcSegmentNotifier(std::shared_ptr<grpc::Channel> channel, folly::Executor* executor,
				bool auth_enabled, std::string auth_token);

		GrpcSegmentNotifier(const std::string& server_address, folly::Executor* executor,
				bool auth_enabled, std::string auth_token);

		/// Wait until the channel is connected or the timeout expires.
		bool Connect(int timeout_ms);

		folly::Future<folly::Unit> SealSegments(const std::string& scope, const std::string& stream,
				const std::vector<int64_t>& segment_ids, const std::string& delegation_token) override;

		std::string RetrieveDelegationToken() override;

	private:
		std::shared_ptr<grpc::Channel> channel_;
		std::unique_ptr<tidewater::segmentstore::SegmentStore::Stub> stub_;
		folly::Executor::KeepAlive<> executor_;
		bool auth_enabled_;
		std::string auth_token_;
		std::atomic<int64_t> next_request_id_{0};
};

} // End of namespace Tidewater

#endif // TIDEWATER_CONTROLLER_GRPC_SEGMENT_NOTIFIER_H_
