// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_MONGOSTORE_HPP
#define STAKEX_MONGOSTORE_HPP

#include "docstore.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace stakex
{

/**
 * Document store backed by a MongoDB database.  Each collection of the
 * store is a MongoDB collection of the same name, whose documents hold
 * the key as _id together with the partition, order value and data.
 *
 * Batches are run as multi-document transactions, which requires the
 * server to be part of a replica set.
 */
class MongoDocumentStore : public DocumentStore
{

private:

  class Impl;

  /** Lock for the client and session, which are not thread-safe.  */
  mutable std::mutex mut;

  std::unique_ptr<Impl> impl;

protected:

  void BeginBatch () override;
  void CommitBatch () override;
  void AbortBatch () override;

public:

  /**
   * Connects to the server at the given URI and uses the named database
   * on it.  Throws PersistenceError if the server cannot be reached.
   */
  explicit MongoDocumentStore (const std::string& uri,
                               const std::string& dbName);

  ~MongoDocumentStore ();

  /**
   * Drops the entire database.  This is used to clean up in tests.
   */
  void DropDatabase ();

  void Upsert (const std::string& collection, const Document& doc) override;
  void UpsertMany (const std::string& collection,
                   const std::vector<Document>& docs) override;
  bool InsertIfAbsent (const std::string& collection,
                       const Document& doc) override;
  bool Get (const std::string& collection, const std::string& key,
            Document& doc) const override;
  std::vector<Document> Query (const std::string& collection,
                               const RangeQuery& q) const override;
  uint64_t Count (const std::string& collection,
                  const std::string& partition) const override;

};

} // namespace stakex

#endif // STAKEX_MONGOSTORE_HPP
