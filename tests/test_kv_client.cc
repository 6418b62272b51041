#include "kv_client.hpp"

#include "fake_kv.hpp"
#include "sim_cluster.hpp"
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class KvClientTest : public ::testing::Test {
protected:
    KvClientTest()
        : cluster_({ "n1" }, WorkloadType::Echo, fast_retries())
    {
        cluster_.add_service("seq-kv", [this](const Message& m) { return kv_(m); });
        cluster_.init();
    }

    static NodeConfig fast_retries()
    {
        NodeConfig cfg;
        cfg.runtime.rpc_timeout_ms = 10;
        cfg.runtime.rpc_max_backoff_ms = 40;
        cfg.runtime.rpc_max_retries = 2;
        return cfg;
    }

    // Issues the call and steps until its callback ran.
    template <typename Call>
    KvResult await(Call call)
    {
        std::optional<KvResult> out;
        call([&out](const KvResult& r) { out = r; });
        for (int i = 0; i < 50 && !out; ++i) cluster_.step();
        EXPECT_TRUE(out) << "callback never ran";
        return out ? *out : KvResult {};
    }

    FakeKv kv_;
    SimCluster cluster_;
};

TEST_F(KvClientTest, ReadOfMissingKeyReportsKeyDoesNotExist)
{
    KvClient kv(cluster_.node("n1"));
    const KvResult r = await([&](KvCallback cb) { kv.read("missing", cb); });

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::KEY_DOES_NOT_EXIST);
    EXPECT_EQ(r.text, "key does not exist");
}

TEST_F(KvClientTest, WriteThenReadReturnsValue)
{
    KvClient kv(cluster_.node("n1"));
    const KvResult w = await([&](KvCallback cb) { kv.write("k", json { { "a", 1 } }, cb); });
    ASSERT_TRUE(w.ok);

    const KvResult r = await([&](KvCallback cb) { kv.read("k", cb); });
    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.value, json({ { "a", 1 } }));
    EXPECT_EQ(cluster_.node("n1").pending_count(), 0U);
}

TEST_F(KvClientTest, CasChecksPrecondition)
{
    KvClient kv(cluster_.node("n1"));
    ASSERT_TRUE(await([&](KvCallback cb) { kv.write(7, 1, cb); }).ok);

    const KvResult stale = await([&](KvCallback cb) { kv.cas(7, 0, 5, false, cb); });
    EXPECT_FALSE(stale.ok);
    EXPECT_EQ(stale.code, ErrorCode::PRECONDITION_FAILED);

    ASSERT_TRUE(await([&](KvCallback cb) { kv.cas(7, 1, 5, false, cb); }).ok);
    EXPECT_EQ(await([&](KvCallback cb) { kv.read(7, cb); }).value, 5);
}

TEST_F(KvClientTest, CasCanCreateMissingKey)
{
    KvClient kv(cluster_.node("n1"));

    const KvResult refused = await([&](KvCallback cb) { kv.cas("fresh", 0, 1, false, cb); });
    EXPECT_EQ(refused.code, ErrorCode::KEY_DOES_NOT_EXIST);

    ASSERT_TRUE(await([&](KvCallback cb) { kv.cas("fresh", 0, 1, true, cb); }).ok);
    EXPECT_EQ(await([&](KvCallback cb) { kv.read("fresh", cb); }).value, 1);
}

TEST_F(KvClientTest, UnreachableServiceTimesOut)
{
    KvClient kv(cluster_.node("n1"), "lin-kv");
    EXPECT_EQ(kv.service(), "lin-kv");

    const KvResult r = await([&](KvCallback cb) { kv.read("k", cb); });

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.code, ErrorCode::TIMEOUT);
    EXPECT_EQ(r.text, "no reply after 3 attempts");
    EXPECT_EQ(kv_.requests(), 0);
}

TEST_F(KvClientTest, LostRequestIsRetried)
{
    KvClient kv(cluster_.node("n1"));
    cluster_.set_fault(std::make_unique<RandomDrop>(1.0, 1));

    std::optional<KvResult> out;
    kv.write("k", 3, [&out](const KvResult& r) { out = r; });
    cluster_.step();
    cluster_.set_fault(std::make_unique<NoFault>());
    for (int i = 0; i < 20 && !out; ++i) cluster_.step();

    ASSERT_TRUE(out);
    EXPECT_TRUE(out->ok);
    EXPECT_EQ(kv_.requests(), 1);
}
