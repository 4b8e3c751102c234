#include "AgentStore.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace Physics;

namespace
{
Agent MakeAgent(AgentId id, float x, float y, float heading)
{
  Agent agent;
  agent.id = id;
  agent.position = Math::float2(x, y);
  agent.heading = heading;
  return agent;
}
}

TEST(AgentStore, ResetKeepsIterationOrder)
{
  AgentStore store;
  ASSERT_TRUE(store.reset({ MakeAgent(4, 0.0f, 0.0f, 0.0f), MakeAgent(1, 1.0f, 0.0f, 0.5f), MakeAgent(9, 2.0f, 0.0f, 1.0f) }));

  ASSERT_EQ(store.size(), 3u);
  EXPECT_EQ(store.agents()[0].id, 4u);
  EXPECT_EQ(store.agents()[1].id, 1u);
  EXPECT_EQ(store.agents()[2].id, 9u);
}

TEST(AgentStore, KeyedAccess)
{
  AgentStore store;
  ASSERT_TRUE(store.reset({ MakeAgent(4, 0.0f, 0.0f, 0.0f), MakeAgent(1, 1.0f, 2.0f, 0.5f) }));

  EXPECT_FLOAT_EQ(store.agent(1).position.x, 1.0f);
  EXPECT_FLOAT_EQ(store.agent(1).position.y, 2.0f);
  EXPECT_FLOAT_EQ(store.agent(1).heading, 0.5f);

  store.agent(4).heading = 3.0f;
  EXPECT_FLOAT_EQ(store.agents()[0].heading, 3.0f);
}

TEST(AgentStore, UnknownIdThrows)
{
  AgentStore store;
  ASSERT_TRUE(store.reset({ MakeAgent(0, 0.0f, 0.0f, 0.0f) }));

  EXPECT_THROW(store.agent(1), std::out_of_range);
}

TEST(AgentStore, DuplicatedIdsAreRejected)
{
  AgentStore store;
  ASSERT_TRUE(store.reset({ MakeAgent(0, 0.0f, 0.0f, 0.0f) }));

  EXPECT_FALSE(store.reset({ MakeAgent(2, 0.0f, 0.0f, 0.0f), MakeAgent(2, 1.0f, 1.0f, 1.0f) }));

  // Previous population untouched
  ASSERT_EQ(store.size(), 1u);
  EXPECT_EQ(store.agents()[0].id, 0u);
}

TEST(AgentStore, CommitOnlyTouchesPendingAgents)
{
  AgentStore store;
  ASSERT_TRUE(store.reset({ MakeAgent(0, 0.0f, 0.0f, 0.1f), MakeAgent(1, 0.0f, 0.0f, 0.2f), MakeAgent(2, 0.0f, 0.0f, 0.3f) }));

  PendingHeadings pending;
  pending[2] = 5.0f;
  pending[0] = -1.0f;
  store.commitHeadings(pending);

  EXPECT_FLOAT_EQ(store.agent(0).heading, -1.0f);
  EXPECT_FLOAT_EQ(store.agent(1).heading, 0.2f);
  EXPECT_FLOAT_EQ(store.agent(2).heading, 5.0f);
}

TEST(AgentStore, PendingHeadingsKeepLastWrite)
{
  PendingHeadings pending;
  pending[3] = 1.0f;
  pending[3] = 2.0f;

  ASSERT_EQ(pending.size(), 1u);
  EXPECT_FLOAT_EQ(pending[3], 2.0f);
}

TEST(Distance, Euclidean)
{
  EXPECT_FLOAT_EQ(Distance(MakeAgent(0, 0.0f, 0.0f, 0.0f), MakeAgent(1, 3.0f, 4.0f, 0.0f)), 5.0f);
  EXPECT_FLOAT_EQ(Distance(MakeAgent(0, -1.0f, 2.0f, 0.0f), MakeAgent(1, 2.0f, -2.0f, 0.0f)), 5.0f);
}

TEST(Distance, Symmetric)
{
  const Agent a = MakeAgent(0, 12.5f, -3.0f, 0.0f);
  const Agent b = MakeAgent(1, -7.0f, 40.25f, 0.0f);

  EXPECT_FLOAT_EQ(Distance(a, b), Distance(b, a));
}

TEST(Distance, CoincidentPositions)
{
  EXPECT_FLOAT_EQ(Distance(MakeAgent(0, 5.0f, 5.0f, 0.0f), MakeAgent(1, 5.0f, 5.0f, 1.0f)), 0.0f);
}
