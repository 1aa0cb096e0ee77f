// tests/message_router_test.cc
#include "dfrank/errors.hh"
#include "dfrank/execution_engine.hh"
#include "dfrank/message_router.hh"

#include <gtest/gtest.h>
#include <vector>

namespace dfrank {
namespace {

class MessageRouterTest : public ::testing::Test {
protected:
  // 1 -> 2, 1 -> 3, 2 -> 3; vertex 3 is dangling
  Graph graph_{{1, 2, 3}, {{1, 2}, {1, 3}, {2, 3}}};
  SequentialEngine engine_;
};

TEST_F(MessageRouterTest, SplitsValueEvenlyOverOutEdges) {
  MessageRouter router(graph_, engine_);
  Contributions in = router.Route({1.0, 1.0, 1.0});

  ASSERT_EQ(in.sums.size(), 3u);
  EXPECT_DOUBLE_EQ(in.sums[0], 0.0);
  EXPECT_DOUBLE_EQ(in.sums[1], 0.5);
  EXPECT_DOUBLE_EQ(in.sums[2], 1.5);
  EXPECT_EQ(in.messages_sent, 3u);
}

TEST_F(MessageRouterTest, DanglingVertexSendsNothing) {
  MessageRouter router(graph_, engine_);
  Contributions in = router.Route({0.0, 0.0, 5.0});

  for (double sum : in.sums) {
    EXPECT_DOUBLE_EQ(sum, 0.0);
  }
  EXPECT_EQ(in.messages_sent, 0u);
}

TEST_F(MessageRouterTest, OnlyFlaggedSendersRoute) {
  MessageRouter router(graph_, engine_);
  Contributions in = router.Route({4.0, 2.0, 1.0}, {0, 1, 0});

  EXPECT_DOUBLE_EQ(in.sums[0], 0.0);
  EXPECT_DOUBLE_EQ(in.sums[1], 0.0);
  EXPECT_DOUBLE_EQ(in.sums[2], 2.0);
  EXPECT_EQ(in.messages_sent, 1u);
}

TEST_F(MessageRouterTest, ReusableAcrossCalls) {
  MessageRouter router(graph_, engine_);
  Contributions first = router.Route({2.0, 0.0, 0.0});
  Contributions second = router.Route({2.0, 0.0, 0.0});
  EXPECT_EQ(first.sums, second.sums);
  EXPECT_EQ(first.messages_sent, second.messages_sent);
}

TEST_F(MessageRouterTest, SizeMismatchThrows) {
  MessageRouter router(graph_, engine_);
  EXPECT_THROW(router.Route({1.0, 1.0}), InvalidArgumentError);
  EXPECT_THROW(router.Route({1.0, 1.0, 1.0}, {1, 1}), InvalidArgumentError);
}

TEST(MessageRouterParallelTest, ThreadCountDoesNotChangeSums) {
  // Every vertex links to the next three, wrapping around
  std::vector<VertexId> ids;
  std::vector<Edge> edges;
  constexpr VertexId kVertices = 64;
  for (VertexId v = 0; v < kVertices; ++v) {
    ids.push_back(v);
    for (VertexId k = 1; k <= 3; ++k) {
      edges.push_back({v, (v + k) % kVertices});
    }
  }
  Graph graph(ids, edges);

  std::vector<double> values;
  for (VertexId v = 0; v < kVertices; ++v) {
    values.push_back(static_cast<double>(v % 7) * 0.75);
  }

  SequentialEngine sequential;
  Contributions expected = MessageRouter(graph, sequential).Route(values);
  EXPECT_EQ(expected.messages_sent, 3u * kVertices);

  // Destinations sum in in-edge order whatever the partition count
  for (size_t threads : {2u, 3u, 4u, 7u}) {
    ThreadedEngine threaded(threads);
    Contributions actual = MessageRouter(graph, threaded).Route(values);
    EXPECT_EQ(actual.sums, expected.sums) << threads << " threads";
    EXPECT_EQ(actual.messages_sent, expected.messages_sent);
  }
}

TEST(MessageRouterParallelTest, ParallelEdgesDeliverOneMessageEach) {
  // 1 -> 2 twice, 1 -> 3 once
  Graph graph({1, 2, 3}, {{1, 2}, {1, 2}, {1, 3}});
  ThreadedEngine engine(3);
  Contributions in = MessageRouter(graph, engine).Route({3.0, 0.0, 0.0});
  EXPECT_DOUBLE_EQ(in.sums[1], 2.0);
  EXPECT_DOUBLE_EQ(in.sums[2], 1.0);
  EXPECT_EQ(in.messages_sent, 3u);
}

} // namespace
} // namespace dfrank
