// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.h"

#include "envconfig.hpp"
#include "nearchain.hpp"

#include "fetchcache.hpp"
#include "fetcher.hpp"
#include "indexer.hpp"
#include "indexstore.hpp"
#include "metrics.hpp"
#include "mongostore.hpp"
#include "processor.hpp"
#include "rpcgateway.hpp"
#include "rpcutils.hpp"
#include "sqlitestore.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <experimental/filesystem>

#include <signal.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace
{

namespace fs = std::experimental::filesystem;

DEFINE_string (validator_account_id, "",
               "account ID of the staking pool to index");

DEFINE_string (primary_rpc, "",
               "URL of the primary NEAR JSON-RPC endpoint");
DEFINE_string (secondary_rpc, "",
               "URL of the NEAR JSON-RPC endpoint used for failover");
DEFINE_string (rpc_headers, "",
               "extra HTTP headers for RPC requests, as k1=v1;k2=v2");

DEFINE_int32 (parallel_limit, 35,
              "maximum number of sub-batches fetched concurrently");
DEFINE_int32 (batch_size, 10,
              "number of blocks per fetched sub-batch");
DEFINE_int64 (epoch_blocks, 43'200,
              "maximum number of blocks per processed range");
DEFINE_int32 (delegator_batch_size, 1'000,
              "number of delegator snapshots per write");

DEFINE_string (mongo_uri, "",
               "if set, store the index in the MongoDB server at this URI"
               " instead of a local SQLite file");
DEFINE_string (datadir, "",
               "directory holding the local database and fetch cache");
DEFINE_string (db_name, "stakex",
               "name of the MongoDB database, or of the database file in"
               " the data directory");
DEFINE_bool (fetch_cache, true,
             "whether to cache fetched sub-batches of unfinished ranges");

DEFINE_int64 (start_height, 0,
              "height to start indexing at (0 for the current epoch)");

DEFINE_string (zmq_address, "",
               "if set, the address to bind the ZMQ publisher to");

DEFINE_string (env_file, ".env",
               "file with environment-style configuration values");

/**
 * The environment variables that provide defaults for our flags.
 */
const std::vector<stakex::EnvFlag> ENV_FLAGS = {
  {"VALIDATOR_ACCOUNT_ID", "validator_account_id"},
  {"PRIMARY_RPC", "primary_rpc"},
  {"SECONDARY_RPC", "secondary_rpc"},
  {"RPC_HEADERS", "rpc_headers"},
  {"PARALLEL_LIMIT", "parallel_limit"},
  {"BATCH_SIZE", "batch_size"},
  {"EPOCH_BLOCKS", "epoch_blocks"},
  {"DELEGATOR_BATCH_SIZE", "delegator_batch_size"},
  {"MONGO_URI", "mongo_uri"},
  {"DATADIR", "datadir"},
  {"DB_NAME", "db_name"},
  {"START_HEIGHT", "start_height"},
  {"ZMQ_ADDRESS", "zmq_address"},
};

/**
 * Loads the environment configuration and applies it to the flag
 * defaults.  The file is given either through the environment itself
 * (STAKEX_ENV_FILE) or the --env_file flag's default, since flags
 * are not parsed yet at this point.
 */
void
ApplyEnvironmentConfig ()
{
  stakex::Environment env;

  std::string file = FLAGS_env_file;
  env.Get ("STAKEX_ENV_FILE", file);
  if (!file.empty () && env.LoadFile (file))
    LOG (INFO) << "Using configuration file " << file;

  const unsigned num = stakex::ApplyEnvironment (env, ENV_FLAGS);
  LOG (INFO) << "Took " << num << " settings from the environment";
}

/**
 * Checks the flags after parsing.  Throws std::runtime_error if something
 * is invalid.
 */
void
ValidateFlags ()
{
  if (FLAGS_validator_account_id.empty ())
    throw std::runtime_error ("--validator_account_id must be set");
  if (FLAGS_primary_rpc.empty ())
    throw std::runtime_error ("--primary_rpc must be set");
  if (FLAGS_secondary_rpc.empty ())
    throw std::runtime_error ("--secondary_rpc must be set");
  if (FLAGS_datadir.empty () && (FLAGS_mongo_uri.empty () || FLAGS_fetch_cache))
    throw std::runtime_error ("--datadir must be set");
  if (FLAGS_db_name.empty ())
    throw std::runtime_error ("--db_name must not be empty");

  if (FLAGS_parallel_limit <= 0)
    throw std::runtime_error ("--parallel_limit must be positive");
  if (FLAGS_batch_size <= 0)
    throw std::runtime_error ("--batch_size must be positive");
  if (FLAGS_epoch_blocks <= 0)
    throw std::runtime_error ("--epoch_blocks must be positive");
  if (FLAGS_delegator_batch_size <= 0)
    throw std::runtime_error ("--delegator_batch_size must be positive");
  if (FLAGS_start_height < 0)
    throw std::runtime_error ("--start_height must not be negative");
}

/**
 * Blocks SIGINT and SIGTERM in the calling thread (and all threads started
 * from it later), so that they can be waited for with sigwait.
 */
sigset_t
BlockShutdownSignals ()
{
  sigset_t res;
  sigemptyset (&res);
  sigaddset (&res, SIGINT);
  sigaddset (&res, SIGTERM);

  const int rc = pthread_sigmask (SIG_BLOCK, &res, nullptr);
  if (rc != 0)
    throw std::runtime_error ("failed to block shutdown signals");

  return res;
}

} // anonymous namespace

int
main (int argc, char* argv[])
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Index the staking activity of a NEAR pool");
  gflags::SetVersionString (PACKAGE_VERSION);

  try
    {
      ApplyEnvironmentConfig ();
      gflags::ParseCommandLineFlags (&argc, &argv, true);
      ValidateFlags ();

      const sigset_t signals = BlockShutdownSignals ();

      const fs::path dataDir(FLAGS_datadir);
      if (!FLAGS_datadir.empty ())
        {
          if (fs::is_directory (dataDir))
            LOG (INFO) << "Using existing data directory: " << dataDir;
          else
            {
              LOG (INFO) << "Creating data directory: " << dataDir;
              fs::create_directories (dataDir);
            }
        }

      const stakex::RpcHeaders headers
          = stakex::ParseRpcHeaders (FLAGS_rpc_headers);
      stakex::RpcGateway gw(
          std::make_unique<stakex::HttpRpcEndpoint> (FLAGS_primary_rpc,
                                                     headers),
          std::make_unique<stakex::HttpRpcEndpoint> (FLAGS_secondary_rpc,
                                                     headers),
          stakex::RetryPolicy::FromFlags ());
      stakex::NearChain chain(gw);

      std::unique_ptr<stakex::DocumentStore> docs;
      if (FLAGS_mongo_uri.empty ())
        {
          const fs::path dbFile = dataDir / (FLAGS_db_name + ".sqlite");
          LOG (INFO) << "Using database " << dbFile;
          docs = std::make_unique<stakex::SqliteDocumentStore> (
              dbFile.string ());
        }
      else
        docs = std::make_unique<stakex::MongoDocumentStore> (FLAGS_mongo_uri,
                                                             FLAGS_db_name);
      stakex::IndexStore store(*docs, FLAGS_validator_account_id,
                               FLAGS_delegator_batch_size);

      stakex::BatchFetcher fetcher(chain, FLAGS_validator_account_id,
                                   FLAGS_parallel_limit, FLAGS_batch_size);
      stakex::RangeProcessor processor(
          chain, store, fetcher,
          stakex::ApyConfig::FromFlags (FLAGS_epoch_blocks));

      std::unique_ptr<stakex::FetchCache> cache;
      if (FLAGS_fetch_cache)
        {
          const fs::path cacheFile
              = dataDir / (FLAGS_db_name + "-fetchcache.sqlite");
          cache = std::make_unique<stakex::SqliteFetchCache> (
              cacheFile.string ());
          fetcher.SetCache (cache.get ());
          processor.SetCache (cache.get ());
        }

      stakex::Indexer indexer(chain, store, fetcher, processor,
                              FLAGS_epoch_blocks, FLAGS_start_height);
      if (!FLAGS_zmq_address.empty ())
        indexer.SetZmqEndpoint (FLAGS_zmq_address);

      indexer.Start ();

      int sig;
      const int rc = sigwait (&signals, &sig);
      if (rc != 0)
        LOG (ERROR) << "Waiting for shutdown signals failed: " << rc;
      else
        LOG (INFO) << "Received signal " << sig << ", shutting down";

      indexer.Stop ();
    }
  catch (const std::exception& exc)
    {
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }
  catch (...)
    {
      std::cerr << "Exception caught" << std::endl;
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
