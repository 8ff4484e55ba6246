#ifndef TIDEWATER_TEST_CONTROLLER_MOCK_COLLABORATORS_H_
#define TIDEWATER_TEST_CONTROLLER_MOCK_COLLABORATORS_H_

#include <gmock/gmock.h>

#include "../../src/controller/interfaces.h"
#include "../../src/store/stream_metadata_store.h"

namespace Tidewater {

class MockStreamMetadataStore : public StreamMetadataStore {
public:
    MOCK_METHOD(OperationContext, CreateContext,
                (const std::string& scope, const std::string& stream), (override));
    MOCK_METHOD(folly::Future<State>, GetState,
                (const std::string& scope, const std::string& stream,
                 const OperationContext& context), (override));
    MOCK_METHOD(folly::Future<folly::Unit>, SetState,
                (const std::string& scope, const std::string& stream, State state,
                 const OperationContext& context), (override));
    MOCK_METHOD(folly::Future<std::vector<Segment>>, GetActiveSegments,
                (const std::string& scope, const std::string& stream,
                 const OperationContext& context), (override));
    MOCK_METHOD(folly::Future<ActiveTxnMap>, GetActiveTxns,
                (const std::string& scope, const std::string& stream,
                 const OperationContext& context), (override));
    MOCK_METHOD(folly::Future<folly::Unit>, SetSealed,
                (const std::string& scope, const std::string& stream,
                 const OperationContext& context), (override));
    MOCK_METHOD(folly::Future<folly::Unit>, CreateTransaction,
                (const std::string& scope, const std::string& stream, const TxnId& txn_id,
                 const OperationContext& context), (override));
    MOCK_METHOD(folly::Future<TxnStatus>, SealTransaction,
                (const std::string& scope, const std::string& stream, const TxnId& txn_id,
                 bool commit, std::optional<int32_t> version,
                 const OperationContext& context), (override));
};

class MockTransactionCoordinator : public TransactionCoordinator {
public:
    MOCK_METHOD(folly::Future<TxnStatus>, AbortTxn,
                (const std::string& scope, const std::string& stream, const TxnId& txn_id,
                 std::optional<int32_t> version, const OperationContext& context), (override));
};

class MockSegmentNotifier : public SegmentNotifier {
public:
    MOCK_METHOD(folly::Future<folly::Unit>, SealSegments,
                (const std::string& scope, const std::string& stream,
                 const std::vector<int64_t>& segment_ids,
                 const std::string& delegation_token), (override));
    MOCK_METHOD(std::string, RetrieveDelegationToken, (), (override));
};

class MockRequestEventWriter : public RequestEventWriter {
public:
    MOCK_METHOD(folly::Future<folly::Unit>, WriteEvent,
                (const SealStreamEvent& event), (override));
};

class MockSealTask : public StreamTask<SealStreamEvent> {
public:
    MOCK_METHOD(folly::Future<folly::Unit>, Execute, (const SealStreamEvent& event), (override));
    MOCK_METHOD(folly::Future<folly::Unit>, WriteBack, (const SealStreamEvent& event), (override));
};

inline SealStreamEvent MakeSealEvent(const std::string& scope, const std::string& stream,
                                     int64_t request_id = 1) {
    SealStreamEvent event;
    event.set_scope(scope);
    event.set_stream(stream);
    event.set_request_id(request_id);
    return event;
}

} // namespace Tidewater

#endif // TIDEWATER_TEST_CONTROLLER_MOCK_COLLABORATORS_H_
