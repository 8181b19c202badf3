// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sqlitestore.hpp"

#include "private/database.hpp"
#include "private/jsonutils.hpp"

#include <glog/logging.h>

namespace stakex
{

class SqliteDocumentStore::Impl
{

public:

  Database db;

  /** The savepoint of the currently active batch, if any.  */
  std::unique_ptr<Database::Savepoint> batch;

  explicit Impl (const std::string& file)
    : db(file)
  {}

  /**
   * Sets up the database schema if it does not exist yet.
   */
  void SetupSchema ();

  /**
   * Writes a document, replacing an existing one with the same key.
   */
  void Replace (const std::string& collection, const Document& doc);

  /**
   * Reads a document from the current row of the statement, which
   * must have selected the key, partition, order and data columns.
   */
  static Document ReadDocument (const Database::Statement& stmt);

};

void
SqliteDocumentStore::Impl::SetupSchema ()
{
  db.Execute (R"(
    CREATE TABLE IF NOT EXISTS `documents` (
      `collection` TEXT NOT NULL,
      `key` TEXT NOT NULL,
      `partition` TEXT NOT NULL,
      `order` INTEGER NOT NULL,
      `data` TEXT NOT NULL,
      PRIMARY KEY (`collection`, `key`)
    );
    CREATE INDEX IF NOT EXISTS `documents_by_order`
      ON `documents` (`collection`, `partition`, `order`);
  )");
}

void
SqliteDocumentStore::Impl::Replace (const std::string& collection,
                                     const Document& doc)
{
  auto stmt = db.Prepare (R"(
    INSERT OR REPLACE INTO `documents`
      (`collection`, `key`, `partition`, `order`, `data`)
      VALUES (?1, ?2, ?3, ?4, ?5)
  )");
  stmt.Bind (1, collection);
  stmt.Bind (2, doc.key);
  stmt.Bind (3, doc.partition);
  stmt.Bind (4, doc.order);
  stmt.Bind (5, StoreJson (doc.data));
  stmt.Execute ();
}

Document
SqliteDocumentStore::Impl::ReadDocument (const Database::Statement& stmt)
{
  Document res;
  res.key = stmt.Get<std::string> (0);
  res.partition = stmt.Get<std::string> (1);
  res.order = stmt.Get<uint64_t> (2);
  res.data = LoadJson (stmt.Get<std::string> (3));
  return res;
}

/* ************************************************************************** */

SqliteDocumentStore::SqliteDocumentStore (const std::string& file)
  : impl(std::make_unique<Impl> (file))
{
  impl->SetupSchema ();
}

SqliteDocumentStore::~SqliteDocumentStore ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (impl->batch == nullptr) << "Batch is still active";
}

void
SqliteDocumentStore::BeginBatch ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (impl->batch == nullptr) << "Nested batches are not supported";
  impl->batch = std::make_unique<Database::Savepoint> (impl->db);
}

void
SqliteDocumentStore::CommitBatch ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (impl->batch != nullptr);

  /* If the commit fails, the savepoint stays active and will be rolled
     back by AbortBatch (through the Batch destructor).  */
  impl->batch->Commit ();
  impl->batch.reset ();
}

void
SqliteDocumentStore::AbortBatch ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (impl->batch != nullptr);
  impl->batch.reset ();
}

void
SqliteDocumentStore::Upsert (const std::string& collection,
                             const Document& doc)
{
  std::lock_guard<std::mutex> lock(mut);
  impl->Replace (collection, doc);
}

void
SqliteDocumentStore::UpsertMany (const std::string& collection,
                                 const std::vector<Document>& docs)
{
  std::lock_guard<std::mutex> lock(mut);

  /* The savepoint nests inside the one of an active batch, if any.  */
  Database::Savepoint sp(impl->db);
  for (const auto& d : docs)
    impl->Replace (collection, d);
  sp.Commit ();
}

bool
SqliteDocumentStore::InsertIfAbsent (const std::string& collection,
                                     const Document& doc)
{
  std::lock_guard<std::mutex> lock(mut);

  auto stmt = impl->db.Prepare (R"(
    INSERT OR IGNORE INTO `documents`
      (`collection`, `key`, `partition`, `order`, `data`)
      VALUES (?1, ?2, ?3, ?4, ?5)
  )");
  stmt.Bind (1, collection);
  stmt.Bind (2, doc.key);
  stmt.Bind (3, doc.partition);
  stmt.Bind (4, doc.order);
  stmt.Bind (5, StoreJson (doc.data));
  stmt.Execute ();

  return impl->db.RowsModified () > 0;
}

bool
SqliteDocumentStore::Get (const std::string& collection,
                          const std::string& key, Document& doc) const
{
  std::lock_guard<std::mutex> lock(mut);

  auto stmt = impl->db.PrepareRo (R"(
    SELECT `key`, `partition`, `order`, `data`
      FROM `documents`
      WHERE `collection` = ?1 AND `key` = ?2
  )");
  stmt.Bind (1, collection);
  stmt.Bind (2, key);

  if (!stmt.Step ())
    return false;

  doc = Impl::ReadDocument (stmt);
  CHECK (!stmt.Step ());

  return true;
}

std::vector<Document>
SqliteDocumentStore::Query (const std::string& collection,
                            const RangeQuery& q) const
{
  std::lock_guard<std::mutex> lock(mut);

  /* We need separate statements for the two orderings, as the direction
     can't be bound as parameter.  A negative limit means "no limit"
     to SQLite.  */
  Database::Statement stmt;
  if (q.descending)
    stmt = impl->db.PrepareRo (R"(
      SELECT `key`, `partition`, `order`, `data`
        FROM `documents`
        WHERE `collection` = ?1 AND `partition` = ?2
          AND `order` >= ?3 AND `order` <= ?4
        ORDER BY `order` DESC, `key` ASC
        LIMIT ?5
    )");
  else
    stmt = impl->db.PrepareRo (R"(
      SELECT `key`, `partition`, `order`, `data`
        FROM `documents`
        WHERE `collection` = ?1 AND `partition` = ?2
          AND `order` >= ?3 AND `order` <= ?4
        ORDER BY `order` ASC, `key` ASC
        LIMIT ?5
    )");

  stmt.Bind (1, collection);
  stmt.Bind (2, q.partition);
  stmt.Bind (3, q.from);
  stmt.Bind (4, q.to);
  if (q.limit == 0)
    stmt.Bind<int64_t> (5, -1);
  else
    stmt.Bind (5, q.limit);

  std::vector<Document> res;
  while (stmt.Step ())
    res.push_back (Impl::ReadDocument (stmt));

  return res;
}

uint64_t
SqliteDocumentStore::Count (const std::string& collection,
                            const std::string& partition) const
{
  std::lock_guard<std::mutex> lock(mut);

  auto stmt = impl->db.PrepareRo (R"(
    SELECT COUNT(*)
      FROM `documents`
      WHERE `collection` = ?1 AND `partition` = ?2
  )");
  stmt.Bind (1, collection);
  stmt.Bind (2, partition);

  CHECK (stmt.Step ());
  const uint64_t res = stmt.Get<uint64_t> (0);
  CHECK (!stmt.Step ());

  return res;
}

/* ************************************************************************** */

} // namespace stakex
