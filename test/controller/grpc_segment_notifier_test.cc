#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <vector>

#include <folly/executors/CPUThreadPoolExecutor.h>
#include <grpcpp/grpcpp.h>
#include <segment_store.grpc.pb.h>

#include "../../src/controller/grpc_segment_notifier.h"
#include "../../src/controller/task_exceptions.h"

using namespace Tidewater;
using tidewater::segmentstore::SealSegmentsReply;
using tidewater::segmentstore::SealSegmentsRequest;
using tidewater::segmentstore::SegmentStore;

namespace {

// Records every request and answers with a configurable result
class FakeSegmentStore final : public SegmentStore::Service {
public:
    grpc::Status SealSegments(grpc::ServerContext* context, const SealSegmentsRequest* request,
                              SealSegmentsReply* reply) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(*request);
        if (!status_.ok()) {
            return status_;
        }
        reply->set_success(success_);
        reply->set_message(success_ ? "" : "segment is being merged");
        return grpc::Status::OK;
    }

    void SetResult(grpc::Status status, bool success) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
        success_ = success;
    }

    std::vector<SealSegmentsRequest> Requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    std::mutex mutex_;
    std::vector<SealSegmentsRequest> requests_;
    grpc::Status status_ = grpc::Status::OK;
    bool success_ = true;
};

} // namespace

class GrpcSegmentNotifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_unique<folly::CPUThreadPoolExecutor>(2);

        int port = 0;
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
        builder.RegisterService(&service_);
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);
        ASSERT_GT(port, 0);
        address_ = "127.0.0.1:" + std::to_string(port);
    }

    void TearDown() override {
        notifier_.reset();
        server_->Shutdown();
        executor_->join();
    }

    void CreateNotifier(bool auth_enabled, const std::string& token) {
        notifier_ = std::make_unique<GrpcSegmentNotifier>(address_, executor_.get(),
                                                          auth_enabled, token);
        ASSERT_TRUE(notifier_->Connect(5000));
    }

    std::unique_ptr<folly::CPUThreadPoolExecutor> executor_;
    FakeSegmentStore service_;
    std::unique_ptr<grpc::Server> server_;
    std::string address_;
    std::unique_ptr<GrpcSegmentNotifier> notifier_;
};

// Test 1: Segment ids and the token reach the segment store
TEST_F(GrpcSegmentNotifierTest, ForwardsRequest) {
    CreateNotifier(true, "secret");
    EXPECT_EQ(notifier_->RetrieveDelegationToken(), "secret");

    notifier_->SealSegments("g1", "s1", {0, 1, 5}, notifier_->RetrieveDelegationToken()).get();

    auto requests = service_.Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].scope(), "g1");
    EXPECT_EQ(requests[0].stream(), "s1");
    ASSERT_EQ(requests[0].segment_ids_size(), 3);
    EXPECT_EQ(requests[0].segment_ids(0), 0);
    EXPECT_EQ(requests[0].segment_ids(1), 1);
    EXPECT_EQ(requests[0].segment_ids(2), 5);
    EXPECT_EQ(requests[0].delegation_token(), "secret");
    EXPECT_GT(requests[0].request_id(), 0);
}

// Test 2: Without auth the token is empty
TEST_F(GrpcSegmentNotifierTest, NoTokenWithoutAuth) {
    CreateNotifier(false, "secret");
    EXPECT_TRUE(notifier_->RetrieveDelegationToken().empty());

    notifier_->SealSegments("g1", "s1", {2}, notifier_->RetrieveDelegationToken()).get();
    auto requests = service_.Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_TRUE(requests[0].delegation_token().empty());
}

// Test 3: A refusal from the segment store fails the future
TEST_F(GrpcSegmentNotifierTest, RefusalFails) {
    CreateNotifier(false, "");
    service_.SetResult(grpc::Status::OK, false);

    try {
        notifier_->SealSegments("g1", "s1", {0}, "").get();
        FAIL() << "Expected SegmentStoreRpcException";
    } catch (const SegmentStoreRpcException& e) {
        EXPECT_EQ(e.status_code(), 0);
    }
}

// Test 4: An rpc error carries its status code
TEST_F(GrpcSegmentNotifierTest, RpcErrorFails) {
    CreateNotifier(false, "");
    service_.SetResult(grpc::Status(grpc::StatusCode::UNAVAILABLE, "draining"), true);

    try {
        notifier_->SealSegments("g1", "s1", {0}, "").get();
        FAIL() << "Expected SegmentStoreRpcException";
    } catch (const SegmentStoreRpcException& e) {
        EXPECT_EQ(e.status_code(), static_cast<int>(grpc::StatusCode::UNAVAILABLE));
    }
}
