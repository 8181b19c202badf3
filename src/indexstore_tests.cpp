// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "indexstore.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

namespace stakex
{
namespace
{

constexpr const char* POOL = "pool.near";

class IndexStoreTests : public testing::Test
{

protected:

  TestDocumentStore docs;
  IndexStore store;

  IndexStoreTests ()
    : store(docs, POOL, 2)
  {}

  static EpochSyncState
  Checkpoint (const uint64_t start, const uint64_t end)
  {
    EpochSyncState res;
    res.startBlock = start;
    res.endBlock = end;
    res.epochId = "epoch";
    res.epoch = 1;
    res.epochStartBlock = start;
    return res;
  }

  static DelegatorSnapshot
  Snapshot (const std::string& id, const uint64_t epoch)
  {
    DelegatorSnapshot res;
    res.delegatorId = id;
    res.validator = POOL;
    res.epoch = epoch;
    res.initialStake = 100;
    return res;
  }

};

TEST_F (IndexStoreTests, Checkpoints)
{
  EpochSyncState latest;
  EXPECT_FALSE (store.GetLatestCheckpoint (latest));

  EXPECT_TRUE (store.AddCheckpoint (Checkpoint (100, 109)));
  EXPECT_TRUE (store.AddCheckpoint (Checkpoint (9, 99)));
  EXPECT_TRUE (store.AddCheckpoint (Checkpoint (110, 200)));
  EXPECT_FALSE (store.AddCheckpoint (Checkpoint (110, 300)));

  const auto all = store.GetCheckpoints ();
  ASSERT_EQ (all.size (), 3);
  EXPECT_EQ (all[0], Checkpoint (9, 99));
  EXPECT_EQ (all[1], Checkpoint (100, 109));
  EXPECT_EQ (all[2], Checkpoint (110, 200));

  ASSERT_TRUE (store.GetLatestCheckpoint (latest));
  EXPECT_EQ (latest, Checkpoint (110, 200));
}

TEST_F (IndexStoreTests, CheckpointsPerValidator)
{
  IndexStore other(docs, "other.near", 10);
  EXPECT_TRUE (other.AddCheckpoint (Checkpoint (1, 5)));

  EpochSyncState latest;
  EXPECT_FALSE (store.GetLatestCheckpoint (latest));
  EXPECT_TRUE (store.AddCheckpoint (Checkpoint (1, 5)));
}

TEST_F (IndexStoreTests, TransactionsDeduplicated)
{
  StakingTransaction tx;
  tx.hash = "tx";
  tx.blockHeight = 10;
  tx.method = "stake";
  tx.action = "FunctionCall";
  tx.type = "stake";
  tx.delegator = "alice.near";

  EXPECT_TRUE (store.AddTransaction (tx));
  EXPECT_FALSE (store.AddTransaction (tx));

  tx.hash = "other";
  tx.blockHeight = 20;
  EXPECT_TRUE (store.AddTransaction (tx));

  EXPECT_EQ (store.GetTransactions (0, 100).size (), 2);
  const auto range = store.GetTransactions (15, 20);
  ASSERT_EQ (range.size (), 1);
  EXPECT_EQ (range[0].hash, "other");
}

TEST_F (IndexStoreTests, Delegators)
{
  /* The batch size is two, so this writes in multiple chunks.  */
  store.PutDelegators ({
    Snapshot ("a", 1),
    Snapshot ("b", 1),
    Snapshot ("c", 1),
    Snapshot ("a", 2),
  });

  EXPECT_EQ (store.GetDelegators (1).size (), 3);
  EXPECT_EQ (store.GetDelegators (3).size (), 0);

  auto updated = Snapshot ("a", 2);
  updated.autoCompoundedStake = 5;
  store.PutDelegators ({updated});

  const auto epoch2 = store.GetDelegators (2);
  ASSERT_EQ (epoch2.size (), 1);
  EXPECT_EQ (epoch2[0], updated);
}

TEST_F (IndexStoreTests, DelegatorWritesPerChunk)
{
  std::vector<DelegatorSnapshot> snapshots;
  for (const std::string id : {"a", "b", "c", "d", "e"})
    snapshots.push_back (Snapshot (id, 1));

  const unsigned before = docs.GetNumWrites ();
  store.PutDelegators (snapshots);
  EXPECT_EQ (docs.GetNumWrites () - before, 3);
  EXPECT_EQ (store.GetDelegators (1).size (), 5);
}

TEST_F (IndexStoreTests, FailedDelegatorChunk)
{
  docs.FailWrites (1);
  EXPECT_THROW (store.PutDelegators ({Snapshot ("a", 1), Snapshot ("b", 1)}),
                PersistenceError);
  EXPECT_EQ (store.GetDelegators (1).size (), 0);
}

TEST_F (IndexStoreTests, MetricsAndPerformance)
{
  ValidatorMetrics m;
  EXPECT_FALSE (store.GetMetrics (1, m));

  m.validator = POOL;
  m.epoch = 1;
  m.epochId = "epoch";
  m.apy = 10.5;
  store.PutMetrics (m);

  m.apy = 11.0;
  store.PutMetrics (m);

  ValidatorMetrics restored;
  ASSERT_TRUE (store.GetMetrics (1, restored));
  EXPECT_EQ (restored.apy, 11.0);
  EXPECT_EQ (docs.Count (IndexStore::VALIDATOR_METRICS, POOL), 1);

  ValidatorPerformance p;
  p.validator = POOL;
  p.epoch = 1;
  p.epochId = "epoch";
  p.blocksExpected = 10;
  store.PutPerformance (p);

  ValidatorPerformance restoredPerf;
  EXPECT_FALSE (store.GetPerformance (2, restoredPerf));
  ASSERT_TRUE (store.GetPerformance (1, restoredPerf));
  EXPECT_EQ (restoredPerf.blocksExpected, 10);
}

TEST_F (IndexStoreTests, EpochData)
{
  EpochData d;
  d.validator = POOL;
  d.epoch = 3;
  d.epochId = "epoch";
  store.PutEpochData (d);
  store.PutEpochData (d);

  EXPECT_EQ (docs.Count (IndexStore::EPOCH_DATA, POOL), 1);
}

} // anonymous namespace
} // namespace stakex
