// Computes the content of a history page from the revisions of a document.
//
// The three steps can be called separately, or all at once with project():
//   RevisionHistoryProjector projector;
//   vector<HistoryEntry> history = projector.link(revisions);
//   PaginatedHistory page = projector.paginate(history, pageRequest, authorization);
//   page.entries = projector.attachTranslationParent(page.entries, page.pagination, history, document);
#ifndef REVHIST_REVISION_HISTORY_PROJECTOR_H
#define REVHIST_REVISION_HISTORY_PROJECTOR_H

#include <optional>
#include <string>
#include <vector>
#include "history_defs.h"

namespace revhist {

// Number of revisions per page if the limit is not specified.
constexpr int DEFAULT_REVISIONS_PER_PAGE = 10;
// Number of revisions per page if the limit is specified but is not a positive integer.
constexpr int DOCUMENTS_PER_PAGE = 100;
// Value of the limit that requests the full history on a single page.
constexpr char ALL_REVISIONS_LIMIT[] = "all";

// A revision as displayed on a history page.
struct HistoryEntry {
  Revision revision;
  // First approved revision of the same document, in chronological order, that was created strictly before
  // `revision`. This is the earliest such revision, not necessarily the closest one.
  std::optional<Revision> previousRevision;
  // True for the revision of the parent document appended after the oldest revision of a translation.
  bool isTranslationSource = false;
};

// Raw values of the "limit" and "page" parameters of a history request. Unset if absent.
struct PageRequest {
  std::optional<std::string> limit;
  std::optional<std::string> page;

  bool showAll() const { return limit && *limit == ALL_REVISIONS_LIMIT; }
};

struct Authorization {
  // Only authenticated users may retrieve the full history on a single page.
  bool authenticated = false;
};

// Describes which part of the history is displayed.
class Pagination {
public:
  // The whole history is displayed on a single, unnumbered page.
  static Pagination allRevisions(int count);
  // Page `number` (1-based) of the history split into pages of `perPage` revisions.
  Pagination(int number, int perPage, int count);

  bool isAll() const { return m_all; }
  int number() const { return m_number; }
  int perPage() const { return m_perPage; }
  int numPages() const { return m_numPages; }
  // Total number of revisions of the document.
  int count() const { return m_count; }
  bool hasNext() const { return !m_all && m_number < m_numPages; }
  bool hasPrevious() const { return !m_all && m_number > 1; }
  // Index of the first revision of the page in the full history.
  int startIndex() const { return m_all ? 0 : (m_number - 1) * m_perPage; }
  // Index after the last revision of the page in the full history.
  int endIndex() const;

private:
  Pagination() = default;

  bool m_all = false;
  int m_number = 1;
  int m_perPage = 0;
  int m_numPages = 1;
  int m_count = 0;
};

struct PaginatedHistory {
  std::vector<HistoryEntry> entries;
  Pagination pagination = Pagination::allRevisions(0);
};

struct ProjectorOptions {
  int defaultPerPage = DEFAULT_REVISIONS_PER_PAGE;
  int fallbackPerPage = DOCUMENTS_PER_PAGE;
};

class RevisionHistoryProjector {
public:
  RevisionHistoryProjector() = default;
  explicit RevisionHistoryProjector(const ProjectorOptions& options) : m_options(options) {}

  // Returns one entry per revision, most recent first, with previousRevision set.
  std::vector<HistoryEntry> link(const std::vector<Revision>& revisions) const;

  // Selects the entries to display from the output of link().
  // Throws: UnauthorizedError if request.showAll() and the user is not authenticated, NoMatchingRevisionsError if
  // history is empty.
  PaginatedHistory paginate(const std::vector<HistoryEntry>& history, const PageRequest& request,
                            const Authorization& authorization) const;

  // On the last page of a translation, returns `entries` followed by the revision that the oldest revision of history
  // was translated from, if any. Otherwise, returns a copy of `entries`.
  std::vector<HistoryEntry> attachTranslationParent(const std::vector<HistoryEntry>& entries,
                                                    const Pagination& pagination,
                                                    const std::vector<HistoryEntry>& history,
                                                    const Document& document) const;

  // Runs the three steps above, after checking that the document has a current revision.
  // Throws: NoPublishableRevisionError, UnauthorizedError, NoMatchingRevisionsError.
  PaginatedHistory project(const Document& document, const std::vector<Revision>& revisions,
                           const PageRequest& request, const Authorization& authorization) const;

  // Number of revisions per page for a limit that is not ALL_REVISIONS_LIMIT.
  int parsePerPage(const std::optional<std::string>& limit) const;

private:
  ProjectorOptions m_options;
};

}  // namespace revhist

#endif
