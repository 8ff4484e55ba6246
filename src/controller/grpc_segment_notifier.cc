#include "grpc_segment_notifier.h"

#include <chrono>

#include <glog/logging.h>
#include <folly/futures/Promise.h>

#include "task_exceptions.h"

namespace Tidewater {

using tidewater::segmentstore::SealSegmentsReply;
using tidewater::segmentstore::SealSegmentsRequest;
using tidewater::segmentstore::SegmentStore;

GrpcSegmentNotifier::GrpcSegmentNotifier(std::shared_ptr<grpc::Channel> channel,
		folly::Executor* executor, bool auth_enabled, std::string auth_token)
	: channel_(std::move(channel)),
	  stub_(SegmentStore::NewStub(channel_)),
	  executor_(folly::getKeepAliveToken(executor)),
	  auth_enabled_(auth_enabled),
	  auth_token_(std::move(auth_token)) {
	CHECK(executor != nullptr) << "GrpcSegmentNotifier needs an executor";
}

GrpcSegmentNotifier::GrpcSegmentNotifier(const std::string& server_address,
		folly::Executor* executor, bool auth_enabled, std::string auth_token)
	: GrpcSegmentNotifier(grpc::CreateChannel(server_address, grpc::InsecureChannelCredentials()),
			executor, auth_enabled, std::move(auth_token)) {
	LOG(INFO) << "Segment store client created for " << server_address;
}

bool GrpcSegmentNotifier::Connect(int timeout_ms) {
	auto deadline = std::chrono::system_clock::now() + std::chrono::milliseconds(timeout_ms);
	bool connected = channel_->WaitForConnected(deadline);
	if (!connected) {
		LOG(ERROR) << "Failed to connect to segment store within " << timeout_ms << "ms";
	}
	return connected;
}

std::string GrpcSegmentNotifier::RetrieveDelegationToken() {
	return auth_enabled_ ? auth_token_ : std::string();
}

folly::Future<folly::Unit> GrpcSegmentNotifier::SealSegments(const std::string& scope,
		const std::string& stream, const std::vector<int64_t>& segment_ids,
		const std::string& delegation_token) {
	// Outlives this call frame; released when the completion callback runs.
	struct Call {
		grpc::ClientContext context;
		SealSegmentsRequest request;
		SealSegmentsReply reply;
		folly::Promise<folly::Unit> promise;
	};
	auto call = std::make_shared<Call>();
	call->request.set_scope(scope);
	call->request.set_stream(stream);
	for (int64_t id : segment_ids) {
		call->request.add_segment_ids(id);
	}
	call->request.set_delegation_token(delegation_token);
	call->request.set_request_id(next_request_id_.fetch_add(1) + 1);

	auto future = call->promise.getSemiFuture().via(executor_.copy());

	VLOG(2) << "SealSegments request " << call->request.request_id() << " for "
		<< scope << "/" << stream << " (" << segment_ids.size() << " segments)";
	stub_->async()->SealSegments(&call->context, &call->request, &call->reply,
			[call, scope, stream](grpc::Status status) {
				if (!status.ok()) {
					LOG(WARNING) << "SealSegments rpc for " << scope << "/" << stream
						<< " failed: " << status.error_message();
					call->promise.setException(SegmentStoreRpcException(
								static_cast<int>(status.error_code()),
								"SealSegments rpc failed: " + status.error_message()));
					return;
				}
				if (!call->reply.success()) {
					LOG(WARNING) << "Segment store refused to seal " << scope << "/" << stream
						<< ": " << call->reply.message();
					call->promise.setException(SegmentStoreRpcException(0,
								"Segment store refused to seal segments: " + call->reply.message()));
					return;
				}
				call->promise.setValue();
			});
	return future;
}

} // End of namespace Tidewater
