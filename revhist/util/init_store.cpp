#include "init_store.h"
#include <memory>
#include "rhbase/args_parser.h"
#include "rhbase/log.h"
#include "rhbase/sqlite.h"
#include "revhist/sqlite_revision_store.h"

namespace revhist {

void StoreFlags::declareFlags(rhbase::ArgsParser& parser) {
  parser.addArgs("--database,required", &m_databasePath);
}

std::unique_ptr<SqliteRevisionStore> openStoreFromFlags(const StoreFlags& flags) {
  RH_INFO << "Opening revision database '" << flags.databasePath() << "'";
  return std::make_unique<SqliteRevisionStore>(flags.databasePath(), sqlite::OPEN_READONLY);
}

}  // namespace revhist
