// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_SQLITESTORE_HPP
#define STAKEX_SQLITESTORE_HPP

#include "docstore.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace stakex
{

class Database;

/**
 * Document store backed by an SQLite database file.  All collections
 * are stored in a single table, with the JSON data serialised as text.
 */
class SqliteDocumentStore : public DocumentStore
{

private:

  class Impl;

  /** Lock for the database, which is not thread-safe by itself.  */
  mutable std::mutex mut;

  /** The underlying database and state.  */
  std::unique_ptr<Impl> impl;

protected:

  void BeginBatch () override;
  void CommitBatch () override;
  void AbortBatch () override;

public:

  /**
   * Opens (and if needed creates) the database in the given file.
   * Throws PersistenceError if that fails.
   */
  explicit SqliteDocumentStore (const std::string& file);

  ~SqliteDocumentStore ();

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

#endif // STAKEX_SQLITESTORE_HPP
