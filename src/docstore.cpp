// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "docstore.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace stakex
{

/* ************************************************************************** */

DocumentStore::Batch::Batch (DocumentStore& s)
  : store(s)
{
  store.BeginBatch ();
}

DocumentStore::Batch::~Batch ()
{
  if (committed)
    return;

  LOG (WARNING) << "Reverting uncommitted document store batch";
  store.AbortBatch ();
}

void
DocumentStore::Batch::Commit ()
{
  CHECK (!committed);
  store.CommitBatch ();
  committed = true;
}

/* ************************************************************************** */

void
MemoryDocumentStore::BeginBatch ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (batchBackup == nullptr) << "Nested batches are not supported";
  batchBackup = std::make_unique<Collections> (collections);
}

void
MemoryDocumentStore::CommitBatch ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (batchBackup != nullptr);
  batchBackup.reset ();
}

void
MemoryDocumentStore::AbortBatch ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (batchBackup != nullptr);
  collections = std::move (*batchBackup);
  batchBackup.reset ();
}

void
MemoryDocumentStore::Upsert (const std::string& collection, const Document& doc)
{
  std::lock_guard<std::mutex> lock(mut);
  collections[collection][doc.key] = doc;
}

void
MemoryDocumentStore::UpsertMany (const std::string& collection,
                                 const std::vector<Document>& docs)
{
  std::lock_guard<std::mutex> lock(mut);
  auto& coll = collections[collection];
  for (const auto& d : docs)
    coll[d.key] = d;
}

bool
MemoryDocumentStore::InsertIfAbsent (const std::string& collection,
                                     const Document& doc)
{
  std::lock_guard<std::mutex> lock(mut);
  return collections[collection].emplace (doc.key, doc).second;
}

bool
MemoryDocumentStore::Get (const std::string& collection,
                          const std::string& key, Document& doc) const
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mitColl = collections.find (collection);
  if (mitColl == collections.end ())
    return false;

  const auto mit = mitColl->second.find (key);
  if (mit == mitColl->second.end ())
    return false;

  doc = mit->second;
  return true;
}

std::vector<Document>
MemoryDocumentStore::Query (const std::string& collection,
                            const RangeQuery& q) const
{
  std::lock_guard<std::mutex> lock(mut);

  std::vector<Document> res;
  const auto mitColl = collections.find (collection);
  if (mitColl == collections.end ())
    return res;

  for (const auto& entry : mitColl->second)
    {
      const auto& doc = entry.second;
      if (doc.partition == q.partition
            && doc.order >= q.from && doc.order <= q.to)
        res.push_back (doc);
    }

  /* Entries come sorted by key from the map, so a stable sort by order
     gives us the same ordering as the SQLite store.  */
  const bool desc = q.descending;
  std::stable_sort (res.begin (), res.end (),
                    [desc] (const Document& a, const Document& b)
                      {
                        return desc ? a.order > b.order : a.order < b.order;
                      });

  if (q.limit > 0 && res.size () > q.limit)
    res.resize (q.limit);

  return res;
}

uint64_t
MemoryDocumentStore::Count (const std::string& collection,
                            const std::string& partition) const
{
  std::lock_guard<std::mutex> lock(mut);

  const auto mitColl = collections.find (collection);
  if (mitColl == collections.end ())
    return 0;

  return std::count_if (mitColl->second.begin (), mitColl->second.end (),
                        [&partition] (const Collection::value_type& entry)
                          {
                            return entry.second.partition == partition;
                          });
}

/* ************************************************************************** */

} // namespace stakex
