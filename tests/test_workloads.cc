#include "echo.hpp"
#include "unique_id.hpp"
#include "workload.hpp"
#include "workloads.hpp"

#include "sim_cluster.hpp"
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

TEST(WorkloadFactory, ParsesNames)
{
    WorkloadType type;
    ASSERT_TRUE(parse_workload("unique-ids", type));
    EXPECT_EQ(type, WorkloadType::UniqueIds);
    ASSERT_TRUE(parse_workload("broadcast", type));
    EXPECT_EQ(type, WorkloadType::Broadcast);
    ASSERT_TRUE(parse_workload("g-counter", type));
    EXPECT_EQ(type, WorkloadType::Counter);
    ASSERT_TRUE(parse_workload("seq-kv-counter", type));
    EXPECT_EQ(type, WorkloadType::KvCounter);
    EXPECT_FALSE(parse_workload("txn-rw-register", type));
    EXPECT_FALSE(parse_workload("", type));
}

TEST(Echo, MirrorsArbitraryPayload)
{
    SimCluster cluster({ "n1" }, WorkloadType::Echo);
    cluster.init();

    const json payload = { { "nested", json::array({ 1, "two", nullptr }) } };
    const MsgId a = cluster.client_send("n1", make_body("echo", { { "echo", "Please echo 35" } }));
    const MsgId b = cluster.client_send("n1", make_body("echo", { { "echo", payload } }));
    cluster.step();

    const auto ra = cluster.reply_to(a);
    const auto rb = cluster.reply_to(b);
    ASSERT_TRUE(ra && rb);
    EXPECT_EQ(ra->body.type, "echo_ok");
    EXPECT_EQ(ra->src, "n1");
    EXPECT_EQ(ra->dest, "c1");
    EXPECT_EQ(ra->body.fields.at("echo"), "Please echo 35");
    EXPECT_EQ(rb->body.fields.at("echo"), payload);
}

TEST(Echo, MissingPayloadIsMalformed)
{
    SimCluster cluster({ "n1" }, WorkloadType::Echo);
    cluster.init();

    const MsgId id = cluster.client_send("n1", make_body("echo"));
    cluster.step();

    const auto r = cluster.reply_to(id);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->body.type, "error");
    EXPECT_EQ(r->body.fields.at("code"), static_cast<int>(ErrorCode::MALFORMED_REQUEST));
}

TEST(IdGenerator, EmbedsNodeStartAndSequence)
{
    IdGenerator gen(0x1a2b);
    EXPECT_EQ(gen.next("n1"), "n1-1a2b-0");
    EXPECT_EQ(gen.next("n1"), "n1-1a2b-1");
    EXPECT_EQ(gen.issued(), 2U);

    IdGenerator restarted(0x1a2c);
    EXPECT_NE(restarted.next("n1"), "n1-1a2b-0");
}

TEST(UniqueIds, ConcurrentGenerateAcrossNodesIsPairwiseDistinct)
{
    const std::vector<NodeId> ids = { "n1", "n2", "n3", "n4", "n5" };
    SimCluster cluster(ids, WorkloadType::UniqueIds);
    cluster.init();

    const int per_node = 200;
    std::vector<MsgId> requests;
    for (int i = 0; i < per_node; ++i) {
        for (const auto& n : ids) {
            requests.push_back(cluster.client_send(n, make_body("generate")));
        }
        if (i % 16 == 0) cluster.step();
    }
    cluster.run_for(Millis(200));

    std::set<std::string> seen;
    for (MsgId r : requests) {
        const auto reply = cluster.reply_to(r);
        ASSERT_TRUE(reply) << "no reply to " << r;
        ASSERT_EQ(reply->body.type, "generate_ok");
        seen.insert(reply->body.fields.at("id").get<std::string>());
    }
    EXPECT_EQ(seen.size(), ids.size() * per_node);
}

TEST(UniqueIds, RetriedRequestYieldsTheSameId)
{
    SimCluster cluster({ "n1" }, WorkloadType::UniqueIds);
    cluster.init();

    Body generate = make_body("generate");
    generate.msg_id = 77;
    cluster.transport("n1").push(make_message("c1", "n1", generate));
    cluster.transport("n1").push(make_message("c1", "n1", generate));
    cluster.step();

    ASSERT_EQ(cluster.client_replies().size(), 2U);
    EXPECT_EQ(cluster.client_replies()[0], cluster.client_replies()[1]);
    EXPECT_EQ(cluster.workload<UniqueIdWorkload>("n1").generator().issued(), 1U);
}

TEST(UniqueIds, SameNodeNamesOnDifferentProcessesDiffer)
{
    IdGenerator first(1000);
    IdGenerator second(1001);

    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(first.next("n1"));
        seen.insert(second.next("n1"));
    }
    EXPECT_EQ(seen.size(), 200U);
}
