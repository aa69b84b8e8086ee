#ifndef HISTORY_PAGE_LIB_H
#define HISTORY_PAGE_LIB_H

#include <optional>
#include <ostream>
#include <string>
#include "revhist/history_defs.h"
#include "revhist/revision_history_projector.h"
#include "revhist/revision_store.h"
#include "revhist/util/init_store.h"

namespace history_page {

struct HistoryRequest {
  // For instance "fr/docs/Web/HTML".
  std::string documentPath;
  // If not empty, replaces the locale of documentPath.
  std::string locale;
  std::optional<std::string> limit;
  std::optional<std::string> page;
  bool authenticated = false;
};

struct HistoryPage {
  revhist::Document document;
  revhist::PaginatedHistory history;
};

// Loads the document and its revisions from a store and selects the part of the history to display.
class HistoryPageBuilder {
public:
  explicit HistoryPageBuilder(revhist::RevisionStore* store,
                              const revhist::ProjectorOptions& options = revhist::ProjectorOptions())
      : m_store(store), m_projector(options) {}

  // Throws: revhist::InvalidDocumentPathError, revhist::NotFoundError, revhist::UnauthorizedError.
  HistoryPage build(const HistoryRequest& request);

private:
  revhist::RevisionStore* m_store;
  revhist::RevisionHistoryProjector m_projector;
};

// Renders the page as text, one line per revision, followed by a line describing the position in the history.
// Example:
//   History of fr/docs/Web
//   #12 2020-03-01T10:00:00Z Alice approved (previous: #7) Fix typo
//   #7 2020-02-01T10:00:00Z Bob approved (previous: none) Translation
//   #3 2020-01-01T10:00:00Z Carol approved [source: en-US/docs/Web] Initial version
//   Page 2 of 2 (12 revisions)
std::string renderHistoryPage(const HistoryPage& page);

// Exit statuses of history_page.
enum ExitStatus {
  STATUS_OK = 0,
  STATUS_NOT_FOUND = 1,
  STATUS_UNAUTHORIZED = 2,
  STATUS_INVALID_PATH = 3,
  STATUS_DATABASE_ERROR = 4,
};

// Builds the page for request and writes it to out. Not found and unauthorized requests are reported on out as
// "404: <message>" and "403: <reason>". Other errors are only logged.
ExitStatus printHistoryPage(revhist::RevisionStore* store, const HistoryRequest& request, std::ostream& out);

// Same as printHistoryPage, reading the database set by --database. A database that cannot be opened or read is
// reported with STATUS_DATABASE_ERROR.
ExitStatus printHistoryPageFromDatabase(const revhist::StoreFlags& storeFlags, const HistoryRequest& request,
                                        std::ostream& out);

}  // namespace history_page

#endif
