#include "sluice/topology_builder.h"
#include "test_support.h"
#include <gtest/gtest.h>

using namespace Sluice;
using SluiceTest::noop_supplier;

class RegistryTest : public ::testing::Test {
protected:
    TopologyBuilder builder;

    // Runs the call and returns the error code it failed with
    template <typename Func> static TopologyError error_of(Func &&func) {
        try {
            func();
        } catch (const TopologyException &e) {
            return e.error();
        }
        ADD_FAILURE() << "Expected a TopologyException";
        return TopologyError::InternalConstructionFailure;
    }
};

TEST_F(RegistryTest, RegistersAllKinds) {
    builder.add_source({.name = "source", .topics = {"in"}})
        .add_processor({.name = "proc", .supplier = noop_supplier(), .parents = {"source"}})
        .add_sink({.name = "sink", .topic = "out", .parents = {"proc"}});

    EXPECT_EQ(builder.node_count(), 3u);
    ASSERT_NE(builder.find_node("proc"), nullptr);
    EXPECT_EQ(node_kind(*builder.find_node("source")), NodeKind::Source);
    EXPECT_EQ(node_kind(*builder.find_node("proc")), NodeKind::Processor);
    EXPECT_EQ(node_kind(*builder.find_node("sink")), NodeKind::Sink);
    EXPECT_EQ(builder.find_node("missing"), nullptr);
    EXPECT_EQ(builder.source_topics(), (std::set<std::string>{"in"}));
}

TEST_F(RegistryTest, DuplicateNodeNameAcrossKinds) {
    builder.add_source({.name = "node", .topics = {"t1"}});

    EXPECT_EQ(error_of([&] { builder.add_source({.name = "node", .topics = {"t2"}}); }),
              TopologyError::DuplicateNodeName);
    EXPECT_EQ(error_of([&] {
                  builder.add_processor({.name = "node", .supplier = noop_supplier()});
              }),
              TopologyError::DuplicateNodeName);
    EXPECT_EQ(error_of([&] { builder.add_sink({.name = "node", .topic = "out"}); }),
              TopologyError::DuplicateNodeName);

    EXPECT_EQ(builder.node_count(), 1u);
    // The rejected source must not have claimed its topic
    EXPECT_EQ(builder.source_topics(), (std::set<std::string>{"t1"}));
}

TEST_F(RegistryTest, DuplicateTopicAcrossSources) {
    builder.add_source({.name = "A", .topics = {"t1", "t2"}});

    EXPECT_EQ(error_of([&] { builder.add_source({.name = "B", .topics = {"t3", "t2"}}); }),
              TopologyError::DuplicateTopic);

    // B registered nothing, so t3 is still free
    EXPECT_EQ(builder.node_count(), 1u);
    EXPECT_EQ(builder.source_topics(), (std::set<std::string>{"t1", "t2"}));
    EXPECT_NO_THROW(builder.add_source({.name = "B", .topics = {"t3"}}));
}

TEST_F(RegistryTest, DuplicateTopicWithinOneSource) {
    EXPECT_EQ(error_of([&] { builder.add_source({.name = "A", .topics = {"t1", "t1"}}); }),
              TopologyError::DuplicateTopic);
    EXPECT_EQ(builder.node_count(), 0u);
    EXPECT_TRUE(builder.source_topics().empty());
}

TEST_F(RegistryTest, SinkTopicDoesNotClaimSourceTopic) {
    builder.add_source({.name = "A", .topics = {"t1"}});
    builder.add_sink({.name = "loop", .topic = "t2", .parents = {"A"}});

    EXPECT_NO_THROW(builder.add_source({.name = "B", .topics = {"t2"}}));
}

TEST_F(RegistryTest, SourceWithoutTopics) {
    EXPECT_EQ(error_of([&] { builder.add_source({.name = "A"}); }), TopologyError::MissingTopics);
    EXPECT_EQ(builder.node_count(), 0u);
}

TEST_F(RegistryTest, SelfParent) {
    builder.add_source({.name = "source", .topics = {"in"}});

    EXPECT_EQ(error_of([&] {
                  builder.add_processor(
                      {.name = "proc", .supplier = noop_supplier(), .parents = {"source", "proc"}});
              }),
              TopologyError::SelfParent);
    EXPECT_EQ(error_of([&] {
                  builder.add_sink({.name = "sink", .topic = "out", .parents = {"sink"}});
              }),
              TopologyError::SelfParent);

    EXPECT_EQ(builder.node_count(), 1u);
}

TEST_F(RegistryTest, UnknownParent) {
    builder.add_source({.name = "source", .topics = {"in"}});

    EXPECT_EQ(error_of([&] {
                  builder.add_processor(
                      {.name = "proc", .supplier = noop_supplier(), .parents = {"later"}});
              }),
              TopologyError::UnknownParent);
    EXPECT_EQ(error_of([&] {
                  builder.add_sink({.name = "sink", .topic = "out", .parents = {"source", "nope"}});
              }),
              TopologyError::UnknownParent);

    EXPECT_EQ(builder.node_count(), 1u);
    EXPECT_EQ(builder.find_node("proc"), nullptr);

    // Registering the parent first makes the same call valid
    builder.add_processor({.name = "later", .supplier = noop_supplier(), .parents = {"source"}});
    EXPECT_NO_THROW(builder.add_processor(
        {.name = "proc", .supplier = noop_supplier(), .parents = {"later"}}));
}

TEST_F(RegistryTest, ProcessorWithoutSupplier) {
    EXPECT_EQ(error_of([&] { builder.add_processor({.name = "proc"}); }),
              TopologyError::InvalidSupplier);
    EXPECT_EQ(builder.node_count(), 0u);
}

TEST_F(RegistryTest, ProcessorWithoutParentsIsAllowed) {
    builder.add_processor({.name = "generator", .supplier = noop_supplier()});
    EXPECT_EQ(builder.node_count(), 1u);
    EXPECT_TRUE(node_parents(*builder.find_node("generator")).empty());
}

TEST_F(RegistryTest, ParentOrderIsPreserved) {
    builder.add_source({.name = "b", .topics = {"t1"}});
    builder.add_source({.name = "a", .topics = {"t2"}});
    builder.add_processor({.name = "join", .supplier = noop_supplier(), .parents = {"b", "a"}});

    EXPECT_EQ(node_parents(*builder.find_node("join")), (std::vector<std::string>{"b", "a"}));
}

TEST_F(RegistryTest, ErrorMessagesNameTheOffender) {
    builder.add_source({.name = "source", .topics = {"in"}});

    try {
        builder.add_sink({.name = "sink", .topic = "out", .parents = {"ghost"}});
        FAIL() << "Expected UnknownParent";
    } catch (const TopologyException &e) {
        EXPECT_NE(std::string(e.what()).find("ghost"), std::string::npos);
        EXPECT_STREQ(to_string(e.error()), "UnknownParent");
    }
}

TEST_F(RegistryTest, DuplicateNameMessageNamesExistingKind) {
    builder.add_source({.name = "source", .topics = {"in"}})
        .add_sink({.name = "sink", .topic = "out", .parents = {"source"}});

    try {
        builder.add_processor({.name = "source", .supplier = noop_supplier()});
        FAIL() << "Expected DuplicateNodeName";
    } catch (const TopologyException &e) {
        EXPECT_EQ(std::string(e.what()), "Source source is already added.");
    }

    try {
        builder.add_source({.name = "sink", .topics = {"other"}});
        FAIL() << "Expected DuplicateNodeName";
    } catch (const TopologyException &e) {
        EXPECT_EQ(std::string(e.what()), "Sink sink is already added.");
    }
}

TEST_F(RegistryTest, RepeatedTopicMessageNamesTheSource) {
    try {
        builder.add_source({.name = "A", .topics = {"t1", "t1"}});
        FAIL() << "Expected DuplicateTopic";
    } catch (const TopologyException &e) {
        EXPECT_EQ(e.error(), TopologyError::DuplicateTopic);
        EXPECT_EQ(std::string(e.what()).find("another source"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("more than once by source A"), std::string::npos);
    }
}
