// Opens the revision database passed on the command line.
//
// Typical use:
//   revhist::StoreFlags storeFlags;
//   rhbase::parseArgs(argc, argv, &storeFlags, /* more command line flags if needed */);
//   std::unique_ptr<revhist::SqliteRevisionStore> store = revhist::openStoreFromFlags(storeFlags);
//
// The path of the database is read from --database, which is required. The database is opened read-only.
#ifndef REVHIST_UTIL_INIT_STORE_H
#define REVHIST_UTIL_INIT_STORE_H

#include <memory>
#include <string>
#include "rhbase/args_parser.h"
#include "revhist/sqlite_revision_store.h"

namespace revhist {

class StoreFlags : public rhbase::FlagsConsumer {
public:
  void declareFlags(rhbase::ArgsParser& parser) override;

  const std::string& databasePath() const { return m_databasePath; }

private:
  std::string m_databasePath;
};

// Throws: rhbase::FileNotFoundError, sqlite::SqliteError.
std::unique_ptr<SqliteRevisionStore> openStoreFromFlags(const StoreFlags& flags);

}  // namespace revhist

#endif
