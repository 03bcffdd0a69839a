#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "client/client.hh"
#include "client/transaction.hh"
#include "fake_connection.hh"

using namespace graphlink;
using graphlink::test::CallLog;
using graphlink::test::FakeConnection;

namespace {

struct Pool {
    std::shared_ptr<CallLog> log = std::make_shared<CallLog>();
    std::vector<std::shared_ptr<FakeConnection>> fakes;

    explicit Pool(int size) {
        for (int i = 0; i < size; i++) {
            fakes.push_back(std::make_shared<FakeConnection>(i, log));
        }
    }

    std::vector<std::shared_ptr<Connection>> connections() const {
        return std::vector<std::shared_ptr<Connection>>(fakes.begin(), fakes.end());
    }
};

}  // namespace

TEST(ClientTest, RejectsInvalidConstruction) {
    EXPECT_THROW(Client(std::vector<std::shared_ptr<Connection>>{}), std::invalid_argument);
    EXPECT_THROW(Client(std::vector<std::shared_ptr<Connection>>{nullptr}), std::invalid_argument);
}

TEST(ClientTest, RoundRobinCoversConnectionsInOrder) {
    Pool pool(3);
    Client client(pool.connections());

    for (int i = 0; i < 7; i++) {
        ASSERT_TRUE(client.check_version().is_ok());
    }

    const auto ids = pool.log->ids();
    ASSERT_EQ(ids.size(), 7u);
    for (size_t i = 0; i < ids.size(); i++) {
        EXPECT_EQ(ids[i], static_cast<int>((ids[0] + i) % 3)) << "call " << i;
    }
}

TEST(ClientTest, RoundRobinSpansTransactions) {
    Pool pool(2);
    Client client(pool.connections());

    auto txn = client.new_transaction();
    ASSERT_TRUE(txn->query("{ q(func: has(name)) { name } }").is_ok());
    ASSERT_TRUE(txn->mutate("{\"name\":\"alice\"}").is_ok());
    ASSERT_TRUE(txn->commit().is_ok());

    EXPECT_EQ(pool.log->ids(), std::vector<int>({0, 1, 0}));
}

TEST(ClientTest, ConcurrentSelectionStaysInRange) {
    Pool pool(4);
    Client client(pool.connections());

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&client]() {
            for (int i = 0; i < 50; i++) {
                EXPECT_TRUE(client.check_version().is_ok());
            }
        });
    }
    for (auto& t : threads) t.join();

    const auto ids = pool.log->ids();
    EXPECT_EQ(ids.size(), 400u);
    for (int id : ids) {
        EXPECT_GE(id, 0);
        EXPECT_LT(id, 4);
    }
}

TEST(ClientTest, CheckVersionReturnsTag) {
    Pool pool(1);
    pool.fakes[0]->version_tag = "v23.1.0";
    Client client(pool.connections());

    auto version = client.check_version();
    ASSERT_TRUE(version.is_ok());
    EXPECT_EQ(version.value(), "v23.1.0");
}

TEST(ClientTest, AdminFailuresBecomeTransportErrors) {
    Pool pool(1);
    pool.fakes[0]->admin_failure = StatusCode::kPermissionDenied;
    Client client(pool.connections());

    protocol::Operation op;
    op.set_schema("name: string @index(exact) .");
    auto altered = client.alter(op);
    ASSERT_TRUE(altered.is_failed());
    EXPECT_EQ(altered.error().code, ErrorCode::kTransport);
    EXPECT_EQ(altered.error().rpc_status, StatusCode::kPermissionDenied);

    auto version = client.check_version();
    ASSERT_TRUE(version.is_failed());
    EXPECT_FALSE(version.has_value());

    protocol::LoginRequest login;
    login.set_userid("groot");
    auto logged_in = client.login(login);
    ASSERT_TRUE(logged_in.is_failed());
    EXPECT_EQ(logged_in.error().rpc_status, StatusCode::kPermissionDenied);

    // no retries
    EXPECT_EQ(pool.fakes[0]->remote_calls(), 3u);
}

TEST(ClientTest, AlterAndLoginPassPayloadsThrough) {
    Pool pool(1);
    Client client(pool.connections());

    protocol::Operation op;
    op.set_drop_all(true);
    ASSERT_TRUE(client.alter(op).is_ok());

    protocol::LoginRequest login;
    login.set_userid("groot");
    login.set_password("password");
    ASSERT_TRUE(client.login(login).is_ok());

    ASSERT_EQ(pool.fakes[0]->alters().size(), 1u);
    EXPECT_TRUE(pool.fakes[0]->alters()[0].drop_all());
    ASSERT_EQ(pool.fakes[0]->logins().size(), 1u);
    EXPECT_EQ(pool.fakes[0]->logins()[0].password(), "password");
}

TEST(ClientTest, DisposedClientRefusesWork) {
    Pool pool(2);
    Client client(pool.connections());
    client.dispose();
    client.dispose();

    EXPECT_TRUE(client.is_disposed());
    EXPECT_THROW(client.new_transaction(), ObjectDisposedError);
    EXPECT_THROW(client.new_read_only_transaction(), ObjectDisposedError);

    auto version = client.check_version();
    ASSERT_TRUE(version.is_failed());
    EXPECT_EQ(version.error().code, ErrorCode::kObjectDisposed);

    EXPECT_THROW(client.execute([](Connection&) { return 0; }, [](const RpcError&) { return 1; }),
                 ObjectDisposedError);
    EXPECT_EQ(pool.fakes[0]->remote_calls(), 0u);
}

TEST(ClientTest, DisposeClosesOwnedConnectionsOnce) {
    Pool owned(2);
    {
        Client client(owned.connections(), true);
        client.dispose();
        client.dispose();
    }
    EXPECT_EQ(owned.fakes[0]->closes(), 1);
    EXPECT_EQ(owned.fakes[1]->closes(), 1);

    Pool borrowed(1);
    {
        Client client(borrowed.connections());
    }
    EXPECT_EQ(borrowed.fakes[0]->closes(), 0);
}

TEST(ClientTest, TransactionsOnDisposedClientReportDisposal) {
    Pool pool(1);
    Client client(pool.connections());
    auto txn = client.new_transaction();
    client.dispose();

    auto response = txn->query("{ q() {} }");
    ASSERT_TRUE(response.is_failed());
    EXPECT_EQ(response.error().code, ErrorCode::kObjectDisposed);
    EXPECT_EQ(txn->state(), TransactionState::kOk);
    EXPECT_EQ(pool.fakes[0]->remote_calls(), 0u);
}

TEST(ClientTest, ExecuteConvertsOnlyRpcErrors) {
    Pool pool(1);
    Client client(pool.connections());

    int converted = client.execute(
        [](Connection&) -> int { throw RpcError(StatusCode::kUnavailable, "down"); },
        [](const RpcError& e) { return static_cast<int>(e.code()); });
    EXPECT_EQ(converted, static_cast<int>(StatusCode::kUnavailable));

    EXPECT_THROW(client.execute([](Connection&) -> int { throw std::out_of_range("bug"); },
                                [](const RpcError&) { return 0; }),
                 std::out_of_range);
}
