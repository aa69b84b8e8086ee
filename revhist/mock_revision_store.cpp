#include "mock_revision_store.h"
#include <memory>
#include <string>
#include <vector>
#include "rhbase/date.h"
#include "history_defs.h"

using rhbase::Date;
using std::string;
using std::vector;

namespace revhist {

Document MockRevisionStore::makeDocument(docid_t documentId, bool withParent) const {
  const DocumentData& data = m_documents.at(documentId);
  Document document;
  document.id = documentId;
  document.locale = data.locale;
  document.slug = data.slug;
  document.currentRevisionId = computeCurrentRevision(documentId);
  if (withParent && data.parentId != INVALID_DOCID && m_documents.count(data.parentId) != 0) {
    document.parent = std::make_shared<Document>(makeDocument(data.parentId, false));
  }
  return document;
}

revid_t MockRevisionStore::computeCurrentRevision(docid_t documentId) const {
  const Revision* current = nullptr;
  for (const auto& [revid, data] : m_revisions) {
    if (data.revision.documentId == documentId && data.revision.isApproved &&
        (current == nullptr || isCreatedBefore(*current, data.revision))) {
      current = &data.revision;
    }
  }
  return current ? current->id : INVALID_REVID;
}

Document MockRevisionStore::getDocument(const string& locale, const string& slug) {
  for (const auto& [documentId, data] : m_documents) {
    if (data.locale == locale && data.slug == slug) {
      return makeDocument(documentId, true);
    }
  }
  throw DocumentNotFoundError("No document '" + slug + "' in locale '" + locale + "'");
}

vector<Revision> MockRevisionStore::getRevisions(const Document& document) {
  m_numRevisionsReads++;
  vector<Revision> revisions;
  for (const auto& [revid, data] : m_revisions) {
    if (data.revision.documentId != document.id) continue;
    Revision revision = data.revision;
    auto basedOnIt = m_revisions.find(data.basedOnId);
    if (basedOnIt != m_revisions.end()) {
      revision.basedOn = std::make_shared<Revision>(basedOnIt->second.revision);
    }
    revisions.push_back(revision);
  }
  return revisions;
}

docid_t MockRevisionStore::addDocument(const string& locale, const string& slug, docid_t parentId) {
  m_lastDocumentId++;
  m_documents[m_lastDocumentId] = {.locale = locale, .slug = slug, .parentId = parentId};
  return m_lastDocumentId;
}

revid_t MockRevisionStore::addRevision(const NewRevision& newRevision) {
  if (m_documents.count(newRevision.documentId) == 0) {
    throw DocumentNotFoundError("Cannot add a revision to missing document " +
                                std::to_string(newRevision.documentId));
  }
  m_lastRevisionId++;
  RevisionData& data = m_revisions[m_lastRevisionId];
  data.revision.id = m_lastRevisionId;
  data.revision.documentId = newRevision.documentId;
  data.revision.createdAt = newRevision.createdAt.isNull() ? Date::now() : newRevision.createdAt;
  data.revision.isApproved = newRevision.isApproved;
  data.revision.creator = newRevision.creator;
  data.revision.comment = newRevision.comment;
  data.basedOnId = newRevision.basedOnId;
  return m_lastRevisionId;
}

void MockRevisionStore::deleteRevision(revid_t revid) {
  m_revisions.erase(revid);
}

}  // namespace revhist
