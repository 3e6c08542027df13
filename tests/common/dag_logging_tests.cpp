/**
 * @file dag_logging_tests.cpp
 * @brief Tests for trace output of Dag operations.
 */
#include <gtest/gtest.h>
#include "dagorder/common/dag.hpp"
#include "dagorder/common/dag.inline.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

using namespace dagorder;

namespace
{

bool any_contains(const std::vector<std::string>& lines, const std::string& needle)
{
    for (const auto& line : lines)
    {
        if (line.find(needle) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

void populate(Dag<int>& dag)
{
    dag.add_node("a", 1, {}, {"c", "b"});
    dag.add_node("b", 2, {}, {"c"});
    dag.add_node("d", 4, {"c"}, {});
}

} // namespace

class DagLoggingTests : public ::testing::Test
{
protected:
    DagLoggingTests()
        : sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(1024))
        , logger(std::make_shared<spdlog::logger>("dagorder_test", sink))
    {
        logger->set_pattern("%l %v");
        logger->set_level(spdlog::level::trace);
    }

    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
    std::shared_ptr<spdlog::logger> logger;
};

TEST_F(DagLoggingTests, AddNode_TracesEdges)
{
    Dag<int> dag(DagOptions{logger});
    dag.add_node("a", 1, {"p"}, {"b"});

    auto lines = sink->last_formatted();
    EXPECT_TRUE(any_contains(lines, "trace [action=add_node] id=a"));
    EXPECT_TRUE(any_contains(lines, "[action=add_edge] from=p to=a"));
    EXPECT_TRUE(any_contains(lines, "[action=add_edge] from=a to=b"));
}

TEST_F(DagLoggingTests, DuplicateEdge_TracedOnce)
{
    Dag<int> dag(DagOptions{logger});
    dag.add_node("a", 1, {}, {"b", "b"});

    size_t count = 0;
    for (const auto& line : sink->last_formatted())
    {
        if (line.find("[action=add_edge] from=a to=b") != std::string::npos)
        {
            ++count;
        }
    }
    EXPECT_EQ(count, 1u);
}

TEST_F(DagLoggingTests, Validate_LogsDetectedCycleAtDebug)
{
    Dag<int> dag(DagOptions{logger});
    dag.add_node("a", 1, {}, {"b"});
    dag.add_node("b", 2, {}, {"a"});
    EXPECT_THROW(dag.validate(), DagCycleError);

    auto lines = sink->last_formatted();
    EXPECT_TRUE(any_contains(lines, "trace [action=validate] id=a"));
    EXPECT_TRUE(any_contains(lines, "debug [action=validate] cycle detected: a -> b -> a"));
}

TEST_F(DagLoggingTests, Order_TracesAppends)
{
    Dag<int> dag(DagOptions{logger});
    populate(dag);
    dag.order();
    EXPECT_TRUE(any_contains(sink->last_formatted(), "[action=order] append id=d"));
}

TEST_F(DagLoggingTests, TraceLevel_DoesNotChangeResults)
{
    Dag<int> traced(DagOptions{logger});
    populate(traced);

    auto quiet_logger = std::make_shared<spdlog::logger>(
        "dagorder_quiet", std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16));
    quiet_logger->set_level(spdlog::level::off);
    Dag<int> quiet(DagOptions{quiet_logger});
    populate(quiet);

    EXPECT_EQ(traced.ids(), quiet.ids());
    EXPECT_EQ(traced.order(), quiet.order());
    EXPECT_NO_THROW(traced.validate());
    EXPECT_NO_THROW(quiet.validate());
    EXPECT_FALSE(traced.has_cycle("a"));
    EXPECT_FALSE(quiet.has_cycle("a"));
    EXPECT_FALSE(sink->last_formatted().empty());
}

TEST(DagLoggingDefaultsTests, NullLogger_UsesDefaultLogger)
{
    Dag<int> dag;
    EXPECT_EQ(dag.options().logger, nullptr);
    dag.add_node("a", 1, {}, {"b"});
    EXPECT_EQ(dag.order(), (NodeIdList{"b", "a"}));
}
