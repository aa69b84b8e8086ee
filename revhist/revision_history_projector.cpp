#include "revision_history_projector.h"
#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "rhbase/string.h"
#include "history_defs.h"

using std::optional;
using std::string;
using std::vector;

namespace revhist {

Pagination Pagination::allRevisions(int count) {
  Pagination pagination;
  pagination.m_all = true;
  pagination.m_perPage = count;
  pagination.m_count = count;
  return pagination;
}

Pagination::Pagination(int number, int perPage, int count) : m_number(number), m_perPage(perPage), m_count(count) {
  if (perPage <= 0 || count < 0) {
    throw rhbase::InvalidStateError("Invalid pagination: perPage=" + std::to_string(perPage) +
                                    ", count=" + std::to_string(count));
  }
  m_numPages = std::max(1, count / perPage + (count % perPage != 0 ? 1 : 0));
  if (number < 1 || number > m_numPages) {
    throw rhbase::InvalidStateError("Page " + std::to_string(number) + " out of range [1, " +
                                    std::to_string(m_numPages) + "]");
  }
}

int Pagination::endIndex() const {
  if (m_all) return m_count;
  return static_cast<int>(std::min<int64_t>(m_count, static_cast<int64_t>(startIndex()) + m_perPage));
}

vector<HistoryEntry> RevisionHistoryProjector::link(const vector<Revision>& revisions) const {
  vector<const Revision*> chronological;
  chronological.reserve(revisions.size());
  for (const Revision& revision : revisions) {
    chronological.push_back(&revision);
  }
  std::sort(chronological.begin(), chronological.end(),
            [](const Revision* r1, const Revision* r2) { return isCreatedBefore(*r1, *r2); });

  vector<HistoryEntry> history;
  history.reserve(chronological.size());
  for (const Revision* revision : chronological) {
    HistoryEntry entry;
    entry.revision = *revision;
    for (const Revision* candidate : chronological) {
      if (!candidate->isApproved || candidate->id == revision->id) {
        continue;
      }
      // The scan stops at the first match, which is the earliest approved revision of the document. Revisions saved
      // in the same second are never linked together.
      if (candidate->createdAt < revision->createdAt) {
        entry.previousRevision = *candidate;
        break;
      }
    }
    history.push_back(std::move(entry));
  }
  std::reverse(history.begin(), history.end());
  return history;
}

int RevisionHistoryProjector::parsePerPage(const optional<string>& limit) const {
  if (!limit) {
    return m_options.defaultPerPage;
  }
  return rhbase::parseIntInRange(string(rhbase::trim(*limit)), 1, INT_MAX, m_options.fallbackPerPage,
                                 rhbase::DEF_IF_TOO_SMALL | rhbase::MAX_IF_TOO_LARGE);
}

PaginatedHistory RevisionHistoryProjector::paginate(const vector<HistoryEntry>& history, const PageRequest& request,
                                                    const Authorization& authorization) const {
  if (request.showAll() && !authorization.authenticated) {
    throw UnauthorizedError(REVISIONS_LOGIN_REQUIRED, "Only authenticated users can list all revisions at once");
  } else if (history.empty()) {
    throw NoMatchingRevisionsError("The document has no revision");
  }
  int count = static_cast<int>(history.size());
  if (request.showAll()) {
    return {history, Pagination::allRevisions(count)};
  }

  int perPage = parsePerPage(request.limit);
  int numPages = Pagination(1, perPage, count).numPages();
  int number = 1;
  if (request.page) {
    // Pages out of range fall back to the first page, like malformed values.
    number = rhbase::parseIntInRange(string(rhbase::trim(*request.page)), 1, numPages, 1);
  }
  Pagination pagination(number, perPage, count);
  vector<HistoryEntry> entries(history.begin() + pagination.startIndex(), history.begin() + pagination.endIndex());
  return {std::move(entries), pagination};
}

vector<HistoryEntry> RevisionHistoryProjector::attachTranslationParent(const vector<HistoryEntry>& entries,
                                                                       const Pagination& pagination,
                                                                       const vector<HistoryEntry>& history,
                                                                       const Document& document) const {
  vector<HistoryEntry> result = entries;
  if (pagination.hasNext() || !document.parent || history.empty()) {
    return result;
  }
  // history is sorted from the most recent revision to the oldest one.
  const Revision& firstRevision = history.back().revision;
  // A translation can be orphaned, in which case its first revision is not based on anything.
  if (firstRevision.basedOn) {
    HistoryEntry sourceEntry;
    sourceEntry.revision = *firstRevision.basedOn;
    sourceEntry.isTranslationSource = true;
    result.push_back(std::move(sourceEntry));
  }
  return result;
}

PaginatedHistory RevisionHistoryProjector::project(const Document& document, const vector<Revision>& revisions,
                                                   const PageRequest& request,
                                                   const Authorization& authorization) const {
  if (!document.hasCurrentRevision()) {
    throw NoPublishableRevisionError("Document '" + document.path() + "' has no current revision");
  }
  vector<HistoryEntry> history = link(revisions);
  PaginatedHistory page = paginate(history, request, authorization);
  page.entries = attachTranslationParent(page.entries, page.pagination, history, document);
  return page;
}

}  // namespace revhist
