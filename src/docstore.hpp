// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEX_DOCSTORE_HPP
#define STAKEX_DOCSTORE_HPP

#include <json/json.h>

#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace stakex
{

/**
 * A single document stored in a collection.
 */
struct Document
{

  /** The unique key of the document within its collection.  */
  std::string key;

  /**
   * The partition of the collection the document is in (typically the
   * validator account).  Range queries are always within one partition.
   */
  std::string partition;

  /** Value used for ordering and range queries within a partition.  */
  uint64_t order = 0;

  /** The actual document data.  */
  Json::Value data;

  Document () = default;

  explicit Document (const std::string& k, const std::string& p,
                     const uint64_t o, const Json::Value& d)
    : key(k), partition(p), order(o), data(d)
  {}

  friend bool
  operator== (const Document& a, const Document& b)
  {
    return a.key == b.key && a.partition == b.partition
            && a.order == b.order && a.data == b.data;
  }

};

/**
 * A query for documents in a partition, within a range of their
 * order value.
 */
struct RangeQuery
{

  std::string partition;

  /** Minimum order value (inclusive).  */
  uint64_t from = 0;

  /** Maximum order value (inclusive).  */
  uint64_t to = std::numeric_limits<int64_t>::max ();

  /** If true, return results in descending order.  */
  bool descending = false;

  /** Maximum number of results to return, zero for no limit.  */
  uint64_t limit = 0;

  RangeQuery () = default;

  explicit RangeQuery (const std::string& p)
    : partition(p)
  {}

};

/**
 * The persistence interface used by the indexer.  It stores JSON documents
 * in named collections, supports keyed upserts and range queries, and
 * can group writes into atomic batches.
 *
 * Failures are reported by throwing PersistenceError.
 */
class DocumentStore
{

public:

  class Batch;

  DocumentStore () = default;
  virtual ~DocumentStore () = default;

  DocumentStore (const DocumentStore&) = delete;
  void operator= (const DocumentStore&) = delete;

  /**
   * Inserts the document, replacing any existing document with
   * the same key.
   */
  virtual void Upsert (const std::string& collection, const Document& doc) = 0;

  /**
   * Upserts a list of documents as a single write operation.  Either all
   * or none of them are written.
   */
  virtual void UpsertMany (const std::string& collection,
                           const std::vector<Document>& docs) = 0;

  /**
   * Inserts the document if no document with its key exists yet.  Returns
   * true if it was inserted.
   */
  virtual bool InsertIfAbsent (const std::string& collection,
                               const Document& doc) = 0;

  /**
   * Looks up a document by key.  Returns false if it does not exist.
   */
  virtual bool Get (const std::string& collection, const std::string& key,
                    Document& doc) const = 0;

  /**
   * Returns all documents matching the range query, ordered by their
   * order value (and key for equal values).
   */
  virtual std::vector<Document> Query (const std::string& collection,
                                       const RangeQuery& q) const = 0;

  /**
   * Returns the number of documents in a partition of a collection.
   */
  virtual uint64_t Count (const std::string& collection,
                          const std::string& partition) const = 0;

protected:

  /**
   * Starts an atomic batch of writes.  Batches are not nested.
   */
  virtual void BeginBatch () = 0;

  /**
   * Makes all writes of the current batch permanent.
   */
  virtual void CommitBatch () = 0;

  /**
   * Reverts all writes of the current batch.  This must not throw.
   */
  virtual void AbortBatch () = 0;

};

/**
 * RAII helper for an atomic batch of writes to a document store.  Unless
 * Commit is called, all writes done while the batch is alive are reverted
 * when it goes out of scope.
 */
class DocumentStore::Batch
{

private:

  /** The store this is for.  */
  DocumentStore& store;

  /** Set to true if the batch has been committed.  */
  bool committed = false;

public:

  explicit Batch (DocumentStore& s);
  ~Batch ();

  Batch () = delete;
  Batch (const Batch&) = delete;
  void operator= (const Batch&) = delete;

  /**
   * Commits all writes of the batch.
   */
  void Commit ();

};

/**
 * Document store that keeps everything in memory.  This is used for
 * testing.
 */
class MemoryDocumentStore : public DocumentStore
{

private:

  /** A collection maps document keys to documents.  */
  using Collection = std::map<std::string, Document>;

  /** All collections by name.  */
  using Collections = std::map<std::string, Collection>;

  /** Lock for this instance.  */
  mutable std::mutex mut;

  /** The data stored.  */
  Collections collections;

  /** If a batch is active, the state before it started.  */
  std::unique_ptr<Collections> batchBackup;

protected:

  void BeginBatch () override;
  void CommitBatch () override;
  void AbortBatch () override;

public:

  MemoryDocumentStore () = default;

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

#endif // STAKEX_DOCSTORE_HPP
