#include "history_page_lib.h"
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include "rhbase/error.h"
#include "rhbase/log.h"
#include "rhbase/sqlite.h"
#include "revhist/document_path.h"
#include "revhist/history_defs.h"
#include "revhist/revision_history_projector.h"
#include "revhist/revision_store.h"
#include "revhist/sqlite_revision_store.h"
#include "revhist/util/init_store.h"

using revhist::HistoryEntry;
using revhist::Pagination;
using std::string;

namespace history_page {

HistoryPage HistoryPageBuilder::build(const HistoryRequest& request) {
  revhist::DocumentPath path = revhist::parseDocumentPath(request.documentPath, request.locale);
  revhist::HistorySnapshot snapshot = m_store->getSnapshot(path.locale, path.slug);
  revhist::PageRequest pageRequest{.limit = request.limit, .page = request.page};
  revhist::Authorization authorization{.authenticated = request.authenticated};
  HistoryPage page;
  page.history = m_projector.project(snapshot.document, snapshot.revisions, pageRequest, authorization);
  page.document = std::move(snapshot.document);
  return page;
}

static string renderEntry(const HistoryEntry& entry, const revhist::Document& document) {
  const revhist::Revision& revision = entry.revision;
  string line = "#" + std::to_string(revision.id) + " " + revision.createdAt.toISO8601() + " " +
                (revision.creator.empty() ? "(unknown)" : revision.creator) + " " +
                (revision.isApproved ? "approved" : "unreviewed");
  if (entry.isTranslationSource) {
    if (document.parent) {
      line += " [source: " + document.parent->path() + "]";
    } else {
      RH_WARNING << "Translation source #" << revision.id << " displayed for " << document.path()
                 << " which has no parent";
      line += " [source]";
    }
  } else if (entry.previousRevision) {
    line += " (previous: #" + std::to_string(entry.previousRevision->id) + ")";
  } else {
    line += " (previous: none)";
  }
  if (!revision.comment.empty()) {
    line += " " + revision.comment;
  }
  return line;
}

static string renderFooter(const Pagination& pagination) {
  if (pagination.isAll()) {
    return "All revisions (" + std::to_string(pagination.count()) + ")";
  }
  string footer = "Page " + std::to_string(pagination.number()) + " of " + std::to_string(pagination.numPages()) +
                  " (" + std::to_string(pagination.count()) + (pagination.count() == 1 ? " revision)" : " revisions)");
  if (pagination.hasPrevious()) {
    footer += ", previous: " + std::to_string(pagination.number() - 1);
  }
  if (pagination.hasNext()) {
    footer += ", next: " + std::to_string(pagination.number() + 1);
  }
  return footer;
}

string renderHistoryPage(const HistoryPage& page) {
  string text = "History of " + page.document.path() + "\n";
  for (const HistoryEntry& entry : page.history.entries) {
    text += renderEntry(entry, page.document);
    text += '\n';
  }
  text += renderFooter(page.history.pagination);
  text += '\n';
  return text;
}

ExitStatus printHistoryPage(revhist::RevisionStore* store, const HistoryRequest& request, std::ostream& out) {
  HistoryPageBuilder builder(store);
  try {
    out << renderHistoryPage(builder.build(request));
  } catch (const revhist::InvalidDocumentPathError& error) {
    RH_ERROR << error.what();
    return STATUS_INVALID_PATH;
  } catch (const revhist::NotFoundError& error) {
    RH_WARNING << "Cannot display the history of '" << request.documentPath << "': " << error.what();
    out << "404: " << error.what() << "\n";
    return STATUS_NOT_FOUND;
  } catch (const revhist::UnauthorizedError& error) {
    RH_WARNING << "Refused to display the full history of '" << request.documentPath << "' to an anonymous user";
    out << "403: " << error.reason() << "\n";
    return STATUS_UNAUTHORIZED;
  }
  return STATUS_OK;
}

ExitStatus printHistoryPageFromDatabase(const revhist::StoreFlags& storeFlags, const HistoryRequest& request,
                                        std::ostream& out) {
  try {
    std::unique_ptr<revhist::SqliteRevisionStore> store = revhist::openStoreFromFlags(storeFlags);
    return printHistoryPage(store.get(), request, out);
  } catch (const rhbase::FileNotFoundError& error) {
    RH_ERROR << error.what();
  } catch (const sqlite::SqliteError& error) {
    RH_ERROR << "Cannot read revision database '" << storeFlags.databasePath() << "': " << error.what();
  }
  return STATUS_DATABASE_ERROR;
}

}  // namespace history_page
