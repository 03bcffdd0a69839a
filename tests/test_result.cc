#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "client/rpc_error.hh"
#include "common/result.hh"

using namespace graphlink;

TEST(ResultTest, OkCarriesValue) {
    auto r = Result<std::string>::ok("tag");
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_failed());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), "tag");
    EXPECT_EQ(r.describe(), "ok");
}

TEST(ResultTest, FailedHasNoValue) {
    auto r = Result<std::string>::fail(TransactionNotOk("Committed"));
    EXPECT_TRUE(r.is_failed());
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::kTransactionNotOk);
    EXPECT_NE(r.error().message.find("Committed"), std::string::npos);
    EXPECT_THROW(r.value(), std::logic_error);
}

TEST(ResultTest, ValueWithErrorsIsFailed) {
    auto r = Result<int>::ok(42);
    r.with_errors({StartTsMismatch()});

    EXPECT_TRUE(r.is_failed());
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
    EXPECT_EQ(r.error().code, ErrorCode::kStartTsMismatch);
}

TEST(ResultTest, VoidResult) {
    auto ok = Result<void>::ok();
    EXPECT_TRUE(ok.is_ok());
    EXPECT_THROW(ok.error(), std::logic_error);

    auto failed = Result<void>::fail(ObjectDisposed("Client"));
    EXPECT_TRUE(failed.is_failed());
    EXPECT_EQ(failed.errors().size(), 1u);
    EXPECT_EQ(failed.describe(), "ObjectDisposed: Client has already been disposed");
}

TEST(ResultTest, RpcErrorConvertsToTransportError) {
    RpcError rpc(StatusCode::kUnavailable, "connection refused");
    Error e = rpc.to_error();

    EXPECT_EQ(e.code, ErrorCode::kTransport);
    EXPECT_EQ(e.rpc_status, StatusCode::kUnavailable);
    EXPECT_NE(e.to_string().find("Transport(UNAVAILABLE)"), std::string::npos);
    EXPECT_NE(e.to_string().find("connection refused"), std::string::npos);
}
