#include <gtest/gtest.h>

#include "errors.hpp"
#include "network.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;

namespace {

NetworkSpec chainSpec() {
    NetworkSpec s;
    s.numFixed = 2;
    s.numFree = 2;
    s.connections = {{0, 2}, {2, 3}, {3, 1}};
    s.outputPos = 3;
    s.outputNeg = 1;
    return s;
}

}  // namespace

TEST(NetworkTest, BuildsFlatElementList) {
    Network net = makeLegacyNetwork();
    EXPECT_EQ(net.numFixed(), 3);
    EXPECT_EQ(net.numFree(), 4);
    EXPECT_EQ(net.numNodes(), 7);
    EXPECT_EQ(net.numWeights(), 10);
    ASSERT_EQ(net.elements().size(), 12u);

    for (int i = 0; i < 10; ++i) {
        const NetworkElement& e = net.elements()[i];
        EXPECT_EQ(e.kind, ElementKind::Weight);
        EXPECT_EQ(e.weightIndex, i);
        EXPECT_EQ(e.nodeA, net.connections()[i].a);
        EXPECT_EQ(e.nodeB, net.connections()[i].b);
    }
    EXPECT_EQ(net.elements()[10].kind, ElementKind::DiodePair);
    EXPECT_EQ(net.elements()[10].nodeA, 3);
    EXPECT_EQ(net.elements()[11].nodeA, 4);
    EXPECT_DOUBLE_EQ(net.elements()[11].anchor, 2.5);
    EXPECT_TRUE(net.isNonlinear());
}

TEST(NetworkTest, NodeIndexing) {
    Network net(chainSpec());
    EXPECT_TRUE(net.isFixed(1));
    EXPECT_FALSE(net.isFixed(2));
    EXPECT_EQ(net.freeIndex(1), -1);
    EXPECT_EQ(net.freeIndex(3), 1);
    EXPECT_EQ(net.nodeName(0), "n0");
    EXPECT_EQ(net.nodeName(3), "n3");
    EXPECT_FALSE(net.isNonlinear());
}

TEST(NetworkTest, DisabledDiodeMakesNetworkLinear) {
    NetworkSpec s = chainSpec();
    DiodeShunt off;
    off.params.Is = 0.0;
    s.diodes[0] = off;
    Network net(s);
    EXPECT_FALSE(net.isNonlinear());
}

TEST(NetworkTest, RejectsEmptyNodeSets) {
    NetworkSpec s = chainSpec();
    s.numFixed = 0;
    EXPECT_THROW(Network{s}, InvalidTopologyError);

    s = chainSpec();
    s.numFree = 0;
    EXPECT_THROW(Network{s}, InvalidTopologyError);
}

TEST(NetworkTest, RejectsBadConnections) {
    NetworkSpec s = chainSpec();
    s.connections.push_back({0, 7});
    EXPECT_THROW(Network{s}, InvalidTopologyError);

    s = chainSpec();
    s.connections.push_back({2, 2});
    EXPECT_THROW(Network{s}, InvalidTopologyError);

    s = chainSpec();
    s.connections.push_back({-1, 2});
    EXPECT_THROW(Network{s}, InvalidTopologyError);
}

TEST(NetworkTest, RejectsBadDiodes) {
    NetworkSpec s = chainSpec();
    s.diodes[5] = DiodeShunt{};
    EXPECT_THROW(Network{s}, InvalidTopologyError);

    s = chainSpec();
    DiodeShunt bad;
    bad.params.N = 0.0;
    s.diodes[0] = bad;
    EXPECT_THROW(Network{s}, InvalidTopologyError);

    s = chainSpec();
    bad = DiodeShunt{};
    bad.params.Is = -1e-9;
    s.diodes[1] = bad;
    EXPECT_THROW(Network{s}, InvalidTopologyError);
}

TEST(NetworkTest, RejectsBadOutputs) {
    NetworkSpec s = chainSpec();
    s.outputPos = 9;
    EXPECT_THROW(Network{s}, InvalidTopologyError);

    s = chainSpec();
    s.outputNeg = s.outputPos;
    EXPECT_THROW(Network{s}, InvalidTopologyError);

    s = chainSpec();
    s.outputNeg = -1;
    EXPECT_THROW(Network{s}, InvalidTopologyError);
}

TEST(NetworkTest, RejectsWrongNameCount) {
    NetworkSpec s = chainSpec();
    s.spiceNames = {"a", "b", "c"};
    EXPECT_THROW(Network{s}, InvalidTopologyError);

    s.spiceNames = {"a", "b", "c", "d"};
    Network net(s);
    EXPECT_EQ(net.nodeName(2), "c");
}

TEST(NetworkTest, RejectsFloatingFreeNode) {
    NetworkSpec s = chainSpec();
    s.numFree = 3;              // n4 没有任何连接
    EXPECT_THROW(Network{s}, InvalidTopologyError);

    // 只挂一个启用的二极管对也算接到了参考轨
    s.diodes[2] = DiodeShunt{};
    EXPECT_NO_THROW(Network{s});

    // Is = 0 的二极管对不算
    s.diodes[2].params.Is = 0.0;
    EXPECT_THROW(Network{s}, InvalidTopologyError);
}

TEST(NetworkTest, IslandOfFreeNodesIsFloating) {
    NetworkSpec s;
    s.numFixed = 1;
    s.numFree = 3;
    s.connections = {{0, 1}, {2, 3}};
    s.outputPos = 1;
    s.outputNeg = 0;
    EXPECT_THROW(Network{s}, InvalidTopologyError);
}
