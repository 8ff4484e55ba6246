#include <gtest/gtest.h>

#include <memory>

#include <folly/executors/CPUThreadPoolExecutor.h>

#include "../../src/store/in_memory_stream_store.h"
#include "../../src/store/store_exception.h"

using namespace Tidewater;

class InMemoryStreamStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_unique<folly::CPUThreadPoolExecutor>(2);
        store_ = std::make_unique<InMemoryStreamStore>(executor_.get());
        store_->CreateStream("g1", "s1", 4).get();
    }

    void TearDown() override {
        store_.reset();
        executor_->join();
    }

    OperationContext Context() { return store_->CreateContext("g1", "s1"); }

    // Type of the StoreException `future` fails with
    template <typename T>
    StoreException::Type FailureType(folly::Future<T> future) {
        try {
            std::move(future).get();
        } catch (const StoreException& e) {
            return e.type();
        }
        ADD_FAILURE() << "Expected a StoreException";
        return StoreException::Type::kUnknown;
    }

    std::unique_ptr<folly::CPUThreadPoolExecutor> executor_;
    std::unique_ptr<InMemoryStreamStore> store_;
};

// Test 1: New streams are ACTIVE with segments covering the whole key space
TEST_F(InMemoryStreamStoreTest, CreateStream) {
    EXPECT_EQ(store_->GetState("g1", "s1", Context()).get(), State::kActive);

    auto segments = store_->GetActiveSegments("g1", "s1", Context()).get();
    ASSERT_EQ(segments.size(), 4u);
    EXPECT_DOUBLE_EQ(segments.front().key_start, 0.0);
    EXPECT_DOUBLE_EQ(segments.back().key_end, 1.0);
    for (size_t i = 0; i < segments.size(); i++) {
        EXPECT_EQ(segments[i].number, static_cast<int64_t>(i));
        if (i > 0) {
            EXPECT_DOUBLE_EQ(segments[i].key_start, segments[i - 1].key_end);
        }
    }
    EXPECT_TRUE(store_->GetActiveTxns("g1", "s1", Context()).get().empty());

    EXPECT_EQ(FailureType(store_->CreateStream("g1", "s1", 1)), StoreException::Type::kDataExists);
    EXPECT_EQ(FailureType(store_->CreateStream("g1", "s2", 0)), StoreException::Type::kIllegalState);
}

// Test 2: Unknown streams fail with DataNotFound
TEST_F(InMemoryStreamStoreTest, MissingStream) {
    auto context = store_->CreateContext("g1", "missing");
    EXPECT_EQ(FailureType(store_->GetState("g1", "missing", context)),
              StoreException::Type::kDataNotFound);
    EXPECT_EQ(FailureType(store_->SetSealed("g1", "missing", context)),
              StoreException::Type::kDataNotFound);
}

// Test 3: Lifecycle transitions are validated
TEST_F(InMemoryStreamStoreTest, StateTransitions) {
    EXPECT_EQ(FailureType(store_->SetState("g1", "s1", State::kSealed, Context())),
              StoreException::Type::kIllegalState);

    store_->SetState("g1", "s1", State::kScaling, Context()).get();
    EXPECT_EQ(FailureType(store_->SetState("g1", "s1", State::kSealing, Context())),
              StoreException::Type::kIllegalState);
    store_->SetState("g1", "s1", State::kActive, Context()).get();

    store_->SetState("g1", "s1", State::kSealing, Context()).get();
    // Asking again is accepted without a write
    const size_t writes = store_->WriteCount();
    store_->SetState("g1", "s1", State::kSealing, Context()).get();
    EXPECT_EQ(store_->WriteCount(), writes);

    EXPECT_EQ(FailureType(store_->SetState("g1", "s1", State::kActive, Context())),
              StoreException::Type::kIllegalState);

    // Reaching SEALED through SetState drops the active segments too
    ASSERT_EQ(store_->GetActiveSegments("g1", "s1", Context()).get().size(), 4u);
    store_->SetState("g1", "s1", State::kSealed, Context()).get();
    EXPECT_EQ(store_->GetState("g1", "s1", Context()).get(), State::kSealed);
    EXPECT_TRUE(store_->GetActiveSegments("g1", "s1", Context()).get().empty());

    const size_t sealed_writes = store_->WriteCount();
    store_->SetSealed("g1", "s1", Context()).get();
    EXPECT_EQ(store_->WriteCount(), sealed_writes);
}

// Test 4: SetSealed requires SEALING and is a no-op on a sealed stream
TEST_F(InMemoryStreamStoreTest, SetSealed) {
    EXPECT_EQ(FailureType(store_->SetSealed("g1", "s1", Context())),
              StoreException::Type::kIllegalState);

    store_->SetState("g1", "s1", State::kSealing, Context()).get();
    store_->SetSealed("g1", "s1", Context()).get();
    EXPECT_EQ(store_->GetState("g1", "s1", Context()).get(), State::kSealed);
    EXPECT_TRUE(store_->GetActiveSegments("g1", "s1", Context()).get().empty());

    const size_t writes = store_->WriteCount();
    store_->SetSealed("g1", "s1", Context()).get();
    store_->SetState("g1", "s1", State::kSealed, Context()).get();
    EXPECT_EQ(store_->WriteCount(), writes);
}

// Test 5: Transaction records move OPEN -> ABORTING/COMMITTING and are dropped when complete
TEST_F(InMemoryStreamStoreTest, TransactionLifecycle) {
    store_->CreateTransaction("g1", "s1", "t1", Context()).get();
    store_->CreateTransaction("g1", "s1", "t2", Context()).get();
    EXPECT_EQ(FailureType(store_->CreateTransaction("g1", "s1", "t1", Context())),
              StoreException::Type::kDataExists);

    auto txns = store_->GetActiveTxns("g1", "s1", Context()).get();
    ASSERT_EQ(txns.size(), 2u);
    EXPECT_EQ(txns.at("t1").status, TxnStatus::kOpen);
    EXPECT_EQ(txns.at("t1").version, 0);

    EXPECT_EQ(store_->SealTransaction("g1", "s1", "t1", false, std::nullopt, Context()).get(),
              TxnStatus::kAborting);
    // Repeating the same decision is idempotent
    EXPECT_EQ(store_->SealTransaction("g1", "s1", "t1", false, std::nullopt, Context()).get(),
              TxnStatus::kAborting);
    // The opposite decision is not
    EXPECT_EQ(FailureType(store_->SealTransaction("g1", "s1", "t1", true, std::nullopt, Context())),
              StoreException::Type::kIllegalState);

    EXPECT_EQ(FailureType(store_->SealTransaction("g1", "s1", "t2", true, 5, Context())),
              StoreException::Type::kWriteConflict);
    EXPECT_EQ(store_->SealTransaction("g1", "s1", "t2", true, 0, Context()).get(),
              TxnStatus::kCommitting);

    EXPECT_EQ(FailureType(store_->SealTransaction("g1", "s1", "t9", false, std::nullopt, Context())),
              StoreException::Type::kDataNotFound);

    store_->CompleteTransaction("g1", "s1", "t1").get();
    store_->CompleteTransaction("g1", "s1", "t2").get();
    EXPECT_TRUE(store_->GetActiveTxns("g1", "s1", Context()).get().empty());
    EXPECT_EQ(FailureType(store_->CompleteTransaction("g1", "s1", "t1")),
              StoreException::Type::kDataNotFound);
}

// Test 6: Open transactions cannot be completed, and new ones need an ACTIVE stream
TEST_F(InMemoryStreamStoreTest, TransactionPreconditions) {
    store_->CreateTransaction("g1", "s1", "t1", Context()).get();
    EXPECT_EQ(FailureType(store_->CompleteTransaction("g1", "s1", "t1")),
              StoreException::Type::kIllegalState);

    store_->SetState("g1", "s1", State::kSealing, Context()).get();
    EXPECT_EQ(FailureType(store_->CreateTransaction("g1", "s1", "t2", Context())),
              StoreException::Type::kOperationNotAllowed);
}

// Test 7: Contexts are unique per call
TEST_F(InMemoryStreamStoreTest, ContextsAreUnique) {
    OperationContext first = Context();
    OperationContext second = Context();
    EXPECT_EQ(first.scope, "g1");
    EXPECT_EQ(first.stream, "s1");
    EXPECT_NE(first.id, second.id);
}

TEST(StreamTypesTest, TransitionTable) {
    EXPECT_TRUE(IsTransitionAllowed(State::kUnknown, State::kCreating));
    EXPECT_TRUE(IsTransitionAllowed(State::kCreating, State::kActive));
    EXPECT_TRUE(IsTransitionAllowed(State::kActive, State::kSealing));
    EXPECT_TRUE(IsTransitionAllowed(State::kTruncating, State::kActive));
    EXPECT_TRUE(IsTransitionAllowed(State::kSealing, State::kSealed));
    EXPECT_TRUE(IsTransitionAllowed(State::kSealed, State::kSealed));
    EXPECT_FALSE(IsTransitionAllowed(State::kActive, State::kSealed));
    EXPECT_FALSE(IsTransitionAllowed(State::kSealed, State::kActive));
    EXPECT_FALSE(IsTransitionAllowed(State::kUpdating, State::kSealing));
    EXPECT_STREQ(StateName(State::kSealing), "SEALING");
}
