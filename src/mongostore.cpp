// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "mongostore.hpp"

#include "errors.hpp"
#include "private/jsonutils.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/json.hpp>

#include <mongocxx/client.hpp>
#include <mongocxx/client_session.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/model/replace_one.hpp>
#include <mongocxx/options/bulk_write.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/replace.hpp>
#include <mongocxx/options/update.hpp>
#include <mongocxx/uri.hpp>

#include <glog/logging.h>

#include <set>

namespace stakex
{

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace
{

/**
 * Runs the given operation against the server, translating exceptions
 * from the driver into PersistenceError.
 */
template <typename Fcn>
  auto
  RunOperation (const std::string& what, Fcn fcn) -> decltype (fcn ())
{
  try
    {
      return fcn ();
    }
  catch (const mongocxx::exception& exc)
    {
      throw PersistenceError ("MongoDB " + what + " failed: " + exc.what ());
    }
  catch (const bsoncxx::exception& exc)
    {
      throw PersistenceError ("BSON error in MongoDB " + what + ": "
                                + exc.what ());
    }
}

/**
 * Returns the driver instance, which must exist exactly once
 * per process.
 */
mongocxx::instance&
GetDriverInstance ()
{
  static mongocxx::instance inst;
  return inst;
}

} // anonymous namespace

class MongoDocumentStore::Impl
{

private:

  /** Collections for which the order index has been set up already.  */
  std::set<std::string> indexed;

public:

  mongocxx::client client;
  mongocxx::database db;

  /**
   * The session all operations are done in.  Batches are transactions
   * on this session.
   */
  mongocxx::client_session session;

  /** True while a batch transaction is running.  */
  bool inBatch = false;

  explicit Impl (const std::string& uri, const std::string& dbName)
    : client(mongocxx::uri (uri)), db(client[dbName]),
      session(client.start_session ())
  {}

  /**
   * Returns the named collection, making sure the index for range queries
   * exists on it.
   */
  mongocxx::collection GetCollection (const std::string& name);

  /**
   * Encodes a document for storage.
   */
  static bsoncxx::document::value Encode (const Document& doc);

  /**
   * Decodes a stored document.
   */
  static Document Decode (bsoncxx::document::view view);

  /**
   * Returns the filter selecting a document by key.
   */
  static bsoncxx::document::value
  KeyFilter (const std::string& key)
  {
    return make_document (kvp ("_id", key));
  }

};

mongocxx::collection
MongoDocumentStore::Impl::GetCollection (const std::string& name)
{
  auto coll = db[name];
  if (indexed.count (name) == 0)
    {
      /* The index is created outside of the session, so that this also
         works while a batch transaction is running.  */
      coll.create_index (make_document (kvp ("partition", 1), kvp ("order", 1),
                                        kvp ("_id", 1)));
      indexed.insert (name);
      VLOG (1) << "Set up index on MongoDB collection " << name;
    }

  return coll;
}

bsoncxx::document::value
MongoDocumentStore::Impl::Encode (const Document& doc)
{
  Json::Value full(Json::objectValue);
  full["_id"] = doc.key;
  full["partition"] = doc.partition;
  full["order"] = static_cast<Json::Int64> (doc.order);
  full["data"] = doc.data;

  return bsoncxx::from_json (StoreJson (full));
}

Document
MongoDocumentStore::Impl::Decode (const bsoncxx::document::view view)
{
  const std::string str
      = bsoncxx::to_json (view, bsoncxx::ExtendedJsonMode::k_relaxed);
  const Json::Value full = LoadJson (str);

  Document res;
  res.key = full["_id"].asString ();
  res.partition = full["partition"].asString ();
  res.order = full["order"].asUInt64 ();
  res.data = full["data"];

  return res;
}

/* ************************************************************************** */

MongoDocumentStore::MongoDocumentStore (const std::string& uri,
                                        const std::string& dbName)
{
  GetDriverInstance ();

  RunOperation ("connection", [&] ()
    {
      impl = std::make_unique<Impl> (uri, dbName);

      /* The client connects lazily, so ping the server to report an
         unreachable database right away.  */
      impl->db.run_command (make_document (kvp ("ping", 1)));
    });

  LOG (INFO) << "Connected to MongoDB database " << dbName;
}

MongoDocumentStore::~MongoDocumentStore ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (impl == nullptr || !impl->inBatch) << "Batch is still active";
}

void
MongoDocumentStore::DropDatabase ()
{
  std::lock_guard<std::mutex> lock(mut);
  RunOperation ("drop", [&] ()
    {
      impl->db.drop ();
    });
}

void
MongoDocumentStore::BeginBatch ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (!impl->inBatch) << "Nested batches are not supported";

  RunOperation ("transaction start", [&] ()
    {
      impl->session.start_transaction ();
    });
  impl->inBatch = true;
}

void
MongoDocumentStore::CommitBatch ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (impl->inBatch);

  /* If the commit fails, the transaction is still active and gets
     aborted through the Batch destructor.  */
  RunOperation ("commit", [&] ()
    {
      impl->session.commit_transaction ();
    });
  impl->inBatch = false;
}

void
MongoDocumentStore::AbortBatch ()
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK (impl->inBatch);
  impl->inBatch = false;

  try
    {
      impl->session.abort_transaction ();
    }
  catch (const mongocxx::exception& exc)
    {
      /* The server discards the transaction on its own when it times out,
         so there is nothing left to do.  */
      LOG (WARNING) << "Failed to abort MongoDB transaction: " << exc.what ();
    }
}

void
MongoDocumentStore::Upsert (const std::string& collection,
                            const Document& doc)
{
  std::lock_guard<std::mutex> lock(mut);
  RunOperation ("upsert", [&] ()
    {
      mongocxx::options::replace opts;
      opts.upsert (true);

      auto coll = impl->GetCollection (collection);
      coll.replace_one (impl->session, Impl::KeyFilter (doc.key),
                        Impl::Encode (doc), opts);
    });
}

void
MongoDocumentStore::UpsertMany (const std::string& collection,
                                const std::vector<Document>& docs)
{
  if (docs.empty ())
    return;

  std::lock_guard<std::mutex> lock(mut);
  RunOperation ("bulk upsert", [&] ()
    {
      auto coll = impl->GetCollection (collection);

      /* Outside of a batch, the bulk write gets its own transaction so
         that it is atomic.  */
      const bool ownTransaction = !impl->inBatch;
      if (ownTransaction)
        impl->session.start_transaction ();

      try
        {
          mongocxx::options::bulk_write opts;
          opts.ordered (true);
          auto bulk = coll.create_bulk_write (impl->session, opts);

          for (const auto& d : docs)
            {
              mongocxx::model::replace_one op(Impl::KeyFilter (d.key),
                                              Impl::Encode (d));
              op.upsert (true);
              bulk.append (op);
            }

          bulk.execute ();
        }
      catch (const mongocxx::exception& exc)
        {
          if (ownTransaction)
            impl->session.abort_transaction ();
          throw;
        }

      if (ownTransaction)
        impl->session.commit_transaction ();
    });
}

bool
MongoDocumentStore::InsertIfAbsent (const std::string& collection,
                                    const Document& doc)
{
  std::lock_guard<std::mutex> lock(mut);
  return RunOperation ("insert", [&] ()
    {
      mongocxx::options::update opts;
      opts.upsert (true);

      auto coll = impl->GetCollection (collection);
      const auto res = coll.update_one (
          impl->session, Impl::KeyFilter (doc.key),
          make_document (kvp ("$setOnInsert", Impl::Encode (doc))), opts);

      return res && res->upserted_id ();
    });
}

bool
MongoDocumentStore::Get (const std::string& collection,
                         const std::string& key, Document& doc) const
{
  std::lock_guard<std::mutex> lock(mut);
  return RunOperation ("lookup", [&] ()
    {
      auto coll = impl->GetCollection (collection);
      const auto res = coll.find_one (impl->session, Impl::KeyFilter (key));
      if (!res)
        return false;

      doc = Impl::Decode (res->view ());
      return true;
    });
}

std::vector<Document>
MongoDocumentStore::Query (const std::string& collection,
                           const RangeQuery& q) const
{
  std::lock_guard<std::mutex> lock(mut);
  return RunOperation ("query", [&] ()
    {
      const int dir = q.descending ? -1 : 1;

      mongocxx::options::find opts;
      opts.sort (make_document (kvp ("order", dir), kvp ("_id", 1)));
      if (q.limit > 0)
        opts.limit (static_cast<int64_t> (q.limit));

      const auto filter = make_document (
          kvp ("partition", q.partition),
          kvp ("order", make_document (
              kvp ("$gte", static_cast<int64_t> (q.from)),
              kvp ("$lte", static_cast<int64_t> (q.to)))));

      auto coll = impl->GetCollection (collection);
      std::vector<Document> res;
      for (const auto& view : coll.find (impl->session, filter.view (), opts))
        res.push_back (Impl::Decode (view));

      return res;
    });
}

uint64_t
MongoDocumentStore::Count (const std::string& collection,
                           const std::string& partition) const
{
  std::lock_guard<std::mutex> lock(mut);
  return RunOperation ("count", [&] ()
    {
      auto coll = impl->GetCollection (collection);
      const int64_t res = coll.count_documents (
          impl->session, make_document (kvp ("partition", partition)));
      return static_cast<uint64_t> (res);
    });
}

} // namespace stakex
