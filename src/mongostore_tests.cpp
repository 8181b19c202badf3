// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "mongostore.hpp"

#include "errors.hpp"
#include "testutils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <memory>

namespace stakex
{
namespace
{

TEST (MongoDocumentStoreConnectionTests, UnreachableServer)
{
  const std::string uri
      = "mongodb://127.0.0.1:1/?serverSelectionTimeoutMS=100";
  EXPECT_THROW (MongoDocumentStore (uri, "stakex_test"), PersistenceError);
}

/**
 * Tests against a real MongoDB server.  They are only run if the
 * STAKEX_TEST_MONGO_URI environment variable points to one (which must be
 * a replica set for the batch tests).  Each test uses a fresh database
 * that is dropped afterwards.
 */
class MongoDocumentStoreTests : public testing::Test
{

protected:

  std::unique_ptr<MongoDocumentStore> store;

  void
  SetUp () override
  {
    const char* uri = std::getenv ("STAKEX_TEST_MONGO_URI");
    if (uri == nullptr)
      GTEST_SKIP () << "STAKEX_TEST_MONGO_URI is not set";

    const auto now = std::chrono::system_clock::now ().time_since_epoch ();
    const std::string dbName
        = "stakex_test_"
            + std::to_string (std::chrono::duration_cast<
                  std::chrono::microseconds> (now).count ());
    store = std::make_unique<MongoDocumentStore> (uri, dbName);
  }

  void
  TearDown () override
  {
    if (store != nullptr)
      store->DropDatabase ();
  }

};

TEST_F (MongoDocumentStoreTests, UpsertAndQuery)
{
  store->Upsert ("coll", Document ("c", "p", 10, ParseJson (R"({"x": 1})")));
  store->Upsert ("coll", Document ("a", "p", 20, ParseJson ("[1, 2]")));
  store->Upsert ("coll", Document ("b", "p", 10, ParseJson ("\"str\"")));
  store->Upsert ("coll", Document ("d", "other", 15, ParseJson ("5")));

  Document doc;
  ASSERT_TRUE (store->Get ("coll", "a", doc));
  EXPECT_EQ (doc, Document ("a", "p", 20, ParseJson ("[1, 2]")));
  EXPECT_FALSE (store->Get ("coll", "missing", doc));

  store->Upsert ("coll", Document ("a", "p", 30, ParseJson ("[3]")));
  ASSERT_TRUE (store->Get ("coll", "a", doc));
  EXPECT_EQ (doc.order, 30);

  RangeQuery q("p");
  q.to = 25;
  const auto res = store->Query ("coll", q);
  ASSERT_EQ (res.size (), 2);
  EXPECT_EQ (res[0].key, "b");
  EXPECT_EQ (res[1].key, "c");

  q = RangeQuery ("p");
  q.descending = true;
  q.limit = 1;
  const auto latest = store->Query ("coll", q);
  ASSERT_EQ (latest.size (), 1);
  EXPECT_EQ (latest[0].key, "a");

  EXPECT_EQ (store->Count ("coll", "p"), 3);
  EXPECT_EQ (store->Count ("coll", "other"), 1);
}

TEST_F (MongoDocumentStoreTests, InsertIfAbsent)
{
  const Document first("a", "p", 1, ParseJson ("1"));
  const Document second("a", "p", 2, ParseJson ("2"));
  EXPECT_TRUE (store->InsertIfAbsent ("coll", first));
  EXPECT_FALSE (store->InsertIfAbsent ("coll", second));

  Document doc;
  ASSERT_TRUE (store->Get ("coll", "a", doc));
  EXPECT_EQ (doc.data, ParseJson ("1"));
}

TEST_F (MongoDocumentStoreTests, UpsertManyAndRollback)
{
  store->UpsertMany ("coll", {
    Document ("a", "p", 1, ParseJson ("1")),
    Document ("b", "p", 2, ParseJson ("2")),
  });
  EXPECT_EQ (store->Count ("coll", "p"), 2);

  {
    DocumentStore::Batch batch(*store);
    store->UpsertMany ("coll", {
      Document ("b", "p", 2, ParseJson ("42")),
      Document ("c", "p", 3, ParseJson ("3")),
    });
  }

  EXPECT_EQ (store->Count ("coll", "p"), 2);
  Document doc;
  ASSERT_TRUE (store->Get ("coll", "b", doc));
  EXPECT_EQ (doc.data, ParseJson ("2"));

  {
    DocumentStore::Batch batch(*store);
    store->Upsert ("coll", Document ("c", "p", 3, ParseJson ("3")));
    batch.Commit ();
  }
  EXPECT_EQ (store->Count ("coll", "p"), 3);
}

} // anonymous namespace
} // namespace stakex
