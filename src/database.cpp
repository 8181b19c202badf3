// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "private/database.hpp"

#include "errors.hpp"

#include <glog/logging.h>

#include <limits>
#include <sstream>

namespace stakex
{

/* ************************************************************************** */

namespace
{

/**
 * Error callback for SQLite, which prints logs using glog.
 */
void
SQLiteErrorLogger (void* arg, const int errCode, const char* msg)
{
  LOG (ERROR) << "SQLite error (code " << errCode << "): " << msg;
}

/**
 * Throws a PersistenceError for the given SQLite result code.
 */
void
ThrowSqliteError (sqlite3* db, const std::string& what, const int rc)
{
  std::ostringstream msg;
  msg << what << " (code " << rc << ")";
  if (db != nullptr)
    msg << ": " << sqlite3_errmsg (db);
  throw PersistenceError (msg.str ());
}

} // anonymous namespace

Database::Database (const std::string& file)
  : db(nullptr)
{
  static bool initialised = false;

  if (!initialised)
    {
      LOG (INFO)
          << "Using SQLite version " << SQLITE_VERSION
          << " (library version: " << sqlite3_libversion () << ")";
      CHECK_EQ (SQLITE_VERSION_NUMBER, sqlite3_libversion_number ())
          << "Mismatch between header and library SQLite versions";

      const int rc
          = sqlite3_config (SQLITE_CONFIG_LOG, &SQLiteErrorLogger, nullptr);
      if (rc != SQLITE_OK)
        LOG (WARNING) << "Failed to set up SQLite error handler: " << rc;
      else
        LOG (INFO) << "Configured SQLite error handler";

      CHECK_EQ (sqlite3_config (SQLITE_CONFIG_MULTITHREAD, nullptr), SQLITE_OK)
          << "Failed to enable multi-threaded mode for SQLite";

      initialised = true;
    }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  const int rc = sqlite3_open_v2 (file.c_str (), &db, flags, nullptr);
  if (rc != SQLITE_OK)
    {
      /* Even on failure, SQLite usually allocates a handle that needs
         to be closed again.  */
      const std::string err
          = db == nullptr ? "out of memory" : sqlite3_errmsg (db);
      if (db != nullptr)
        sqlite3_close (db);
      db = nullptr;
      throw PersistenceError ("Failed to open SQLite database " + file
                                + ": " + err);
    }

  CHECK (db != nullptr);
  LOG (INFO) << "Opened SQLite database successfully: " << file;

  /* Another process (or the user) may be reading the database while we
     write to it.  Wait a bit before reporting SQLITE_BUSY.  */
  sqlite3_busy_timeout (db, 1'000);
}

Database::~Database ()
{
  statements.clear ();

  CHECK (db != nullptr);
  CHECK_EQ (sqlite3_close (db), SQLITE_OK) << "Failed to close SQLite database";
}

namespace
{

/**
 * Callback for sqlite3_exec that expects not to be called.
 */
int
ExpectNoResult (void* data, int columns, char** strs, char** names)
{
  LOG (FATAL) << "Expected no result from DB query";
}

} // anonymous namespace

void
Database::Execute (const std::string& sql)
{
  const int rc = sqlite3_exec (db, sql.c_str (), &ExpectNoResult,
                               nullptr, nullptr);
  if (rc != SQLITE_OK)
    ThrowSqliteError (db, "Failed to execute SQL", rc);
}

Database::Statement
Database::Prepare (const std::string& sql)
{
  return PrepareRo (sql);
}

Database::Statement
Database::PrepareRo (const std::string& sql) const
{
  CHECK (db != nullptr);

  const auto mit = statements.find (sql);
  if (mit != statements.end ())
    return Statement (*mit->second);

  sqlite3_stmt* stmt = nullptr;
  CHECK_EQ (sqlite3_prepare_v2 (db, sql.c_str (), sql.size () + 1,
                                &stmt, nullptr),
            SQLITE_OK)
      << "Failed to prepare SQL statement:\n" << sql;

  auto entry = std::make_unique<CachedStatement> (stmt);
  Statement res(*entry);

  VLOG (2)
      << "Created new SQL statement cache entry " << entry.get ()
      << " for:\n" << sql;
  statements.emplace (sql, std::move (entry));

  return res;
}

unsigned
Database::RowsModified () const
{
  return sqlite3_changes (db);
}

/* ************************************************************************** */

Database::CachedStatement::~CachedStatement ()
{
  CHECK (!used) << "Cached statement is still in use";

  /* sqlite3_finalize returns the error code corresponding to the last
     evaluation of the statement, not an error code "about" finalising it.
     Thus we want to ignore it here.  */
  sqlite3_finalize (stmt);
}

void
Database::CachedStatement::Acquire ()
{
  CHECK (!used) << "Cached statement is already in use";
  used = true;
}

void
Database::CachedStatement::Release ()
{
  CHECK (used) << "Cached statement is not in use";
  used = false;

  CHECK_EQ (sqlite3_clear_bindings (stmt), SQLITE_OK);
  /* sqlite3_reset returns an error code if the last execution of the
     statement had an error.  We don't care about that here.  */
  sqlite3_reset (stmt);
}

/* ************************************************************************** */

Database::Statement::Statement (CachedStatement& s)
  : entry(&s)
{
  s.Acquire ();
}

Database::Statement::Statement (Statement&& o)
{
  *this = std::move (o);
}

Database::Statement&
Database::Statement::operator= (Statement&& o)
{
  Clear ();

  entry = o.entry;
  o.entry = nullptr;

  return *this;
}

Database::Statement::~Statement ()
{
  Clear ();
}

void
Database::Statement::Clear ()
{
  if (entry != nullptr)
    {
      entry->Release ();
      entry = nullptr;
    }
}

void
Database::Statement::Execute ()
{
  CHECK (!Step ()) << "Statement returned rows where none were expected";
}

sqlite3_stmt*
Database::Statement::operator* () const
{
  CHECK (entry != nullptr) << "Statement is empty";
  return entry->stmt;
}

bool
Database::Statement::Step ()
{
  const int rc = sqlite3_step (**this);
  switch (rc)
    {
    case SQLITE_ROW:
      return true;
    case SQLITE_DONE:
      return false;
    default:
      ThrowSqliteError (sqlite3_db_handle (**this),
                        "Unexpected SQLite step result", rc);
    }

  /* Not reached, ThrowSqliteError always throws.  */
  return false;
}

template <>
  void
  Database::Statement::Bind<int64_t> (const int ind, const int64_t& val)
{
  CHECK_EQ (sqlite3_bind_int64 (**this, ind, val), SQLITE_OK);
}

template <>
  void
  Database::Statement::Bind<uint64_t> (const int ind, const uint64_t& val)
{
  CHECK_LE (val, std::numeric_limits<int64_t>::max ());
  Bind<int64_t> (ind, val);
}

template <>
  void
  Database::Statement::Bind<std::string> (const int ind,
                                          const std::string& val)
{
  CHECK_EQ (sqlite3_bind_text (**this, ind, val.data (), val.size (),
                               SQLITE_TRANSIENT),
            SQLITE_OK);
}

void
Database::Statement::BindBlob (const int ind, const std::string& val)
{
  CHECK_EQ (sqlite3_bind_blob (**this, ind, val.data (), val.size (),
                               SQLITE_TRANSIENT),
            SQLITE_OK);
}

template <>
  int64_t
  Database::Statement::Get<int64_t> (const int ind) const
{
  return sqlite3_column_int64 (**this, ind);
}

template <>
  uint64_t
  Database::Statement::Get<uint64_t> (const int ind) const
{
  const int64_t val = Get<int64_t> (ind);
  CHECK_GE (val, 0);
  return val;
}

template <>
  std::string
  Database::Statement::Get<std::string> (const int ind) const
{
  const int len = sqlite3_column_bytes (**this, ind);
  if (len == 0)
    return std::string ();

  const unsigned char* str = sqlite3_column_text (**this, ind);
  CHECK (str != nullptr);
  return std::string (reinterpret_cast<const char*> (str), len);
}

std::string
Database::Statement::GetBlob (const int ind) const
{
  const void* data = sqlite3_column_blob (**this, ind);
  const int len = sqlite3_column_bytes (**this, ind);
  if (len == 0)
    return std::string ();

  CHECK (data != nullptr);
  return std::string (static_cast<const char*> (data), len);
}

/* ************************************************************************** */

Database::Savepoint::Savepoint (Database& d)
  : db(d)
{
  db.Execute ("SAVEPOINT `stakex-batch`");
}

Database::Savepoint::~Savepoint ()
{
  if (committed)
    return;

  /* The destructor must not throw, and a failure to roll back is not
     something we can recover from.  */
  try
    {
      db.Execute ("ROLLBACK TO `stakex-batch`");
      db.Execute ("RELEASE `stakex-batch`");
      VLOG (1) << "Rolled back database savepoint";
    }
  catch (const PersistenceError& exc)
    {
      LOG (FATAL) << "Failed to roll back savepoint: " << exc.what ();
    }
}

void
Database::Savepoint::Commit ()
{
  CHECK (!committed);
  db.Execute ("RELEASE `stakex-batch`");
  committed = true;
}

/* ************************************************************************** */

} // namespace stakex
