#ifndef REVHIST_REVISION_STORE_H
#define REVHIST_REVISION_STORE_H

#include <string>
#include <vector>
#include "rhbase/date.h"
#include "history_defs.h"

namespace revhist {

// A document and all its revisions, read at the same point in time.
struct HistorySnapshot {
  Document document;
  // In unspecified order.
  std::vector<Revision> revisions;
};

struct NewRevision {
  docid_t documentId = INVALID_DOCID;
  // Date::now() if null.
  rhbase::Date createdAt;
  bool isApproved = false;
  std::string creator;
  std::string comment;
  // Revision of the parent document this revision is translated from.
  revid_t basedOnId = INVALID_REVID;
};

// Read access to the documents and revisions of the wiki.
class RevisionStore {
public:
  virtual ~RevisionStore() = default;

  // Throws: DocumentNotFoundError.
  virtual Document getDocument(const std::string& locale, const std::string& slug) = 0;

  // Returns all revisions of a document, with their basedOn revision loaded.
  virtual std::vector<Revision> getRevisions(const Document& document) = 0;

  // Default implementation calling getDocument and getRevisions. Implementations where the data can change between
  // the two calls should override it.
  // Throws: DocumentNotFoundError.
  virtual HistorySnapshot getSnapshot(const std::string& locale, const std::string& slug);
};

}  // namespace revhist

#endif
