#ifndef REVHIST_HISTORY_DEFS_H
#define REVHIST_HISTORY_DEFS_H

#include <cstdint>
#include <memory>
#include <string>
#include "rhbase/date.h"
#include "rhbase/error.h"

namespace revhist {

class HistoryError : public rhbase::Error {
public:
  using Error::Error;
};

// Base class for the conditions that the presentation layer reports as "not found".
class NotFoundError : public HistoryError {
public:
  using HistoryError::HistoryError;
};

// No document exists for the requested (locale, slug).
class DocumentNotFoundError : public NotFoundError {
public:
  using NotFoundError::NotFoundError;
};

// The document exists but has no current revision.
class NoPublishableRevisionError : public NotFoundError {
public:
  using NotFoundError::NotFoundError;
};

// The document has no revision at all.
class NoMatchingRevisionsError : public NotFoundError {
public:
  using NotFoundError::NotFoundError;
};

// Reason code of UnauthorizedError when an anonymous user asks for the full history.
constexpr char REVISIONS_LOGIN_REQUIRED[] = "revisions_login_required";

class UnauthorizedError : public HistoryError {
public:
  UnauthorizedError(const std::string& reason, const std::string& message) : HistoryError(message), m_reason(reason) {}
  // Machine-readable reason, e.g. REVISIONS_LOGIN_REQUIRED.
  const std::string& reason() const { return m_reason; }

private:
  std::string m_reason;
};

using revid_t = int64_t;
using docid_t = int64_t;

constexpr revid_t INVALID_REVID = 0;
constexpr docid_t INVALID_DOCID = 0;

struct Revision {
  revid_t id = INVALID_REVID;
  docid_t documentId = INVALID_DOCID;
  rhbase::Date createdAt;
  bool isApproved = false;
  std::string creator;
  std::string comment;
  // Revision of the parent document that this revision was translated from. Set on the first revision of a
  // translation. Null if there is none or if the source revision was deleted.
  std::shared_ptr<const Revision> basedOn;
};

// Chronological order of revisions: by creation date, then by id for revisions saved during the same second.
bool isCreatedBefore(const Revision& revision1, const Revision& revision2);

struct Document {
  docid_t id = INVALID_DOCID;
  std::string locale;
  std::string slug;
  revid_t currentRevisionId = INVALID_REVID;
  // Document in the original language if this document is a translation. Its own parent is never loaded.
  std::shared_ptr<const Document> parent;

  bool hasCurrentRevision() const { return currentRevisionId != INVALID_REVID; }
  // Returns "locale/docs/slug".
  std::string path() const;
};

}  // namespace revhist

#endif
