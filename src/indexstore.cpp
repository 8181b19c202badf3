// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "indexstore.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace stakex
{

constexpr const char* IndexStore::EPOCH_SYNC;
constexpr const char* IndexStore::TRANSACTIONS;
constexpr const char* IndexStore::DELEGATORS;
constexpr const char* IndexStore::VALIDATOR_METRICS;
constexpr const char* IndexStore::VALIDATOR_PERFORMANCE;
constexpr const char* IndexStore::EPOCH_DATA;

namespace
{

/**
 * Formats a number zero-padded, so that keys sort lexicographically in
 * the same order as the numbers.
 */
std::string
PaddedNumber (const uint64_t num)
{
  std::ostringstream out;
  out << std::setw (20) << std::setfill ('0') << num;
  return out.str ();
}

/**
 * Builds the document key for a per-epoch record of the validator.
 */
std::string
EpochKey (const std::string& validator, const uint64_t epoch)
{
  return validator + "|" + PaddedNumber (epoch);
}

} // anonymous namespace

IndexStore::IndexStore (DocumentStore& s, const std::string& v,
                        const unsigned delegatorBatch)
  : store(s), validator(v), delegatorBatchSize(delegatorBatch)
{
  CHECK (!validator.empty ());
  CHECK_GT (delegatorBatchSize, 0);
}

std::vector<EpochSyncState>
IndexStore::GetCheckpoints () const
{
  std::vector<EpochSyncState> res;
  for (const auto& doc : store.Query (EPOCH_SYNC, RangeQuery (validator)))
    res.push_back (EpochSyncState::FromJson (doc.data));
  return res;
}

bool
IndexStore::GetLatestCheckpoint (EpochSyncState& out) const
{
  RangeQuery q(validator);
  q.descending = true;
  q.limit = 1;

  const auto docs = store.Query (EPOCH_SYNC, q);
  if (docs.empty ())
    return false;

  out = EpochSyncState::FromJson (docs.front ().data);
  return true;
}

bool
IndexStore::AddCheckpoint (const EpochSyncState& s)
{
  const Document doc(validator + "|" + PaddedNumber (s.startBlock), validator,
                     s.startBlock, s.ToJson ());
  return store.InsertIfAbsent (EPOCH_SYNC, doc);
}

bool
IndexStore::AddTransaction (const StakingTransaction& tx)
{
  const Document doc(tx.hash, validator, tx.blockHeight, tx.ToJson ());
  return store.InsertIfAbsent (TRANSACTIONS, doc);
}

std::vector<StakingTransaction>
IndexStore::GetTransactions (const uint64_t fromHeight,
                             const uint64_t toHeight) const
{
  RangeQuery q(validator);
  q.from = fromHeight;
  q.to = toHeight;

  std::vector<StakingTransaction> res;
  for (const auto& doc : store.Query (TRANSACTIONS, q))
    res.push_back (StakingTransaction::FromJson (doc.data));
  return res;
}

void
IndexStore::PutDelegators (const std::vector<DelegatorSnapshot>& snapshots)
{
  for (size_t start = 0; start < snapshots.size ();
       start += delegatorBatchSize)
    {
      const size_t end = std::min (snapshots.size (),
                                   start + delegatorBatchSize);
      VLOG (1)
          << "Writing delegator snapshots " << start << " to " << end
          << " of " << snapshots.size ();

      std::vector<Document> docs;
      docs.reserve (end - start);
      for (size_t i = start; i < end; ++i)
        {
          const auto& s = snapshots[i];
          CHECK_EQ (s.validator, validator);
          const std::string key
              = s.delegatorId + "|" + EpochKey (validator, s.epoch);
          docs.emplace_back (key, validator, s.epoch, s.ToJson ());
        }

      store.UpsertMany (DELEGATORS, docs);
    }
}

std::vector<DelegatorSnapshot>
IndexStore::GetDelegators (const uint64_t epoch) const
{
  RangeQuery q(validator);
  q.from = epoch;
  q.to = epoch;

  std::vector<DelegatorSnapshot> res;
  for (const auto& doc : store.Query (DELEGATORS, q))
    res.push_back (DelegatorSnapshot::FromJson (doc.data));
  return res;
}

void
IndexStore::PutMetrics (const ValidatorMetrics& m)
{
  CHECK_EQ (m.validator, validator);
  store.Upsert (VALIDATOR_METRICS,
                Document (EpochKey (validator, m.epoch), validator, m.epoch,
                          m.ToJson ()));
}

bool
IndexStore::GetMetrics (const uint64_t epoch, ValidatorMetrics& m) const
{
  Document doc;
  if (!store.Get (VALIDATOR_METRICS, EpochKey (validator, epoch), doc))
    return false;

  m = ValidatorMetrics::FromJson (doc.data);
  return true;
}

void
IndexStore::PutPerformance (const ValidatorPerformance& p)
{
  CHECK_EQ (p.validator, validator);
  store.Upsert (VALIDATOR_PERFORMANCE,
                Document (EpochKey (validator, p.epoch), validator, p.epoch,
                          p.ToJson ()));
}

bool
IndexStore::GetPerformance (const uint64_t epoch,
                            ValidatorPerformance& p) const
{
  Document doc;
  if (!store.Get (VALIDATOR_PERFORMANCE, EpochKey (validator, epoch), doc))
    return false;

  p = ValidatorPerformance::FromJson (doc.data);
  return true;
}

void
IndexStore::PutEpochData (const EpochData& d)
{
  CHECK_EQ (d.validator, validator);
  store.Upsert (EPOCH_DATA,
                Document (PaddedNumber (d.epoch) + "|" + validator, validator,
                          d.epoch, d.ToJson ()));
}

} // namespace stakex
