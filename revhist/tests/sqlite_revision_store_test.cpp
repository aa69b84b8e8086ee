#include "revhist/sqlite_revision_store.h"
#include <memory>
#include <string>
#include <vector>
#include "rhbase/date.h"
#include "rhbase/error.h"
#include "rhbase/log.h"
#include "rhbase/sqlite.h"
#include "rhbase/tempfile.h"
#include "rhbase/unittest.h"
#include "revhist/history_defs.h"
#include "revhist/revision_store.h"

using rhbase::Date;
using rhbase::TempFile;
using std::string;
using std::unique_ptr;
using std::vector;

namespace revhist {

static const Revision* findRevision(const vector<Revision>& revisions, revid_t revid) {
  for (const Revision& revision : revisions) {
    if (revision.id == revid) return &revision;
  }
  return nullptr;
}

class SqliteRevisionStoreTest : public rhbase::Test {
private:
  void setUp() override {
    m_tempFile = std::make_unique<TempFile>();
    m_store = std::make_unique<SqliteRevisionStore>(m_tempFile->path(), sqlite::OPEN_OR_CREATE);
  }

  void tearDown() override {
    m_store.reset();
    m_tempFile.reset();
  }

  revid_t addRevision(docid_t documentId, const string& createdAt, bool isApproved, revid_t basedOnId = INVALID_REVID) {
    return m_store->addRevision({.documentId = documentId,
                                 .createdAt = Date::fromISO8601(createdAt),
                                 .isApproved = isApproved,
                                 .creator = "Alice",
                                 .comment = "Edit of " + createdAt,
                                 .basedOnId = basedOnId});
  }

  RH_TEST_CASE(getDocument) {
    docid_t parentId = m_store->addDocument("en-US", "Web/HTML");
    docid_t documentId = m_store->addDocument("fr", "Web/HTML", parentId);

    Document document = m_store->getDocument("fr", "Web/HTML");
    RH_ASSERT_EQ(document.id, documentId);
    RH_ASSERT_EQ(document.locale, "fr");
    RH_ASSERT_EQ(document.slug, "Web/HTML");
    RH_ASSERT(!document.hasCurrentRevision());
    RH_ASSERT(document.parent != nullptr);
    RH_ASSERT_EQ(document.parent->id, parentId);
    RH_ASSERT_EQ(document.parent->path(), "en-US/docs/Web/HTML");

    Document parent = m_store->getDocument("en-US", "Web/HTML");
    RH_ASSERT(parent.parent == nullptr);
  }

  RH_TEST_CASE(insertWithoutParentOrSource) {
    docid_t documentId = m_store->addDocument("fr", "Web/CSS");
    revid_t revid = addRevision(documentId, "2020-01-01T00:00:00Z", true);

    HistorySnapshot snapshot = m_store->getSnapshot("fr", "Web/CSS");
    RH_ASSERT_EQ(snapshot.document.id, documentId);
    RH_ASSERT(snapshot.document.parent == nullptr);
    RH_ASSERT_EQ(snapshot.document.currentRevisionId, revid);
    RH_ASSERT_EQ(snapshot.revisions.size(), 1U);
    RH_ASSERT_EQ(snapshot.revisions[0].id, revid);
    RH_ASSERT(snapshot.revisions[0].basedOn == nullptr);
  }

  RH_TEST_CASE(getMissingDocument) {
    m_store->addDocument("fr", "Web/HTML");
    bool exceptionThrown = false;
    try {
      m_store->getDocument("de", "Web/HTML");
    } catch (const DocumentNotFoundError&) {
      exceptionThrown = true;
    }
    RH_ASSERT(exceptionThrown);
  }

  RH_TEST_CASE(duplicateDocument) {
    m_store->addDocument("fr", "Web/HTML");
    bool exceptionThrown = false;
    try {
      m_store->addDocument("fr", "Web/HTML");
    } catch (const sqlite::UniqueConstraintError&) {
      exceptionThrown = true;
    }
    RH_ASSERT(exceptionThrown);
  }

  RH_TEST_CASE(currentRevisionIsLatestApproved) {
    docid_t documentId = m_store->addDocument("fr", "Web/HTML");
    revid_t revid1 = addRevision(documentId, "2020-01-01T00:00:00Z", true);
    RH_ASSERT_EQ(m_store->getDocument("fr", "Web/HTML").currentRevisionId, revid1);
    addRevision(documentId, "2020-01-02T00:00:00Z", false);
    RH_ASSERT_EQ(m_store->getDocument("fr", "Web/HTML").currentRevisionId, revid1);
    revid_t revid3 = addRevision(documentId, "2020-01-03T00:00:00Z", true);
    RH_ASSERT_EQ(m_store->getDocument("fr", "Web/HTML").currentRevisionId, revid3);

    m_store->deleteRevision(revid3);
    RH_ASSERT_EQ(m_store->getDocument("fr", "Web/HTML").currentRevisionId, revid1);
    m_store->deleteRevision(revid1);
    RH_ASSERT(!m_store->getDocument("fr", "Web/HTML").hasCurrentRevision());
  }

  RH_TEST_CASE(addRevisionToMissingDocument) {
    bool exceptionThrown = false;
    try {
      addRevision(42, "2020-01-01T00:00:00Z", true);
    } catch (const DocumentNotFoundError&) {
      exceptionThrown = true;
    }
    RH_ASSERT(exceptionThrown);
  }

  RH_TEST_CASE(getRevisions) {
    docid_t documentId = m_store->addDocument("fr", "Web/HTML");
    docid_t otherDocumentId = m_store->addDocument("fr", "Web/CSS");
    revid_t revid1 = addRevision(documentId, "2020-01-01T10:00:00Z", true);
    addRevision(otherDocumentId, "2020-01-01T11:00:00Z", true);
    revid_t revid2 = addRevision(documentId, "2020-01-01T12:00:00Z", false);

    vector<Revision> revisions = m_store->getRevisions(m_store->getDocument("fr", "Web/HTML"));
    RH_ASSERT_EQ(revisions.size(), 2U);
    const Revision* revision1 = findRevision(revisions, revid1);
    RH_ASSERT(revision1 != nullptr);
    RH_ASSERT_EQ(revision1->documentId, documentId);
    RH_ASSERT_EQ(revision1->createdAt, Date::fromISO8601("2020-01-01T10:00:00Z"));
    RH_ASSERT(revision1->isApproved);
    RH_ASSERT_EQ(revision1->creator, "Alice");
    RH_ASSERT_EQ(revision1->comment, "Edit of 2020-01-01T10:00:00Z");
    RH_ASSERT(revision1->basedOn == nullptr);
    const Revision* revision2 = findRevision(revisions, revid2);
    RH_ASSERT(revision2 != nullptr);
    RH_ASSERT(!revision2->isApproved);
  }

  RH_TEST_CASE(translationSource) {
    docid_t parentId = m_store->addDocument("en-US", "Web/HTML");
    docid_t documentId = m_store->addDocument("fr", "Web/HTML", parentId);
    revid_t sourceRevid = addRevision(parentId, "2020-01-01T00:00:00Z", true);
    revid_t revid = addRevision(documentId, "2020-02-01T00:00:00Z", true, sourceRevid);

    HistorySnapshot snapshot = m_store->getSnapshot("fr", "Web/HTML");
    RH_ASSERT_EQ(snapshot.document.id, documentId);
    RH_ASSERT_EQ(snapshot.document.currentRevisionId, revid);
    RH_ASSERT_EQ(snapshot.revisions.size(), 1U);
    const Revision& revision = snapshot.revisions[0];
    RH_ASSERT(revision.basedOn != nullptr);
    RH_ASSERT_EQ(revision.basedOn->id, sourceRevid);
    RH_ASSERT_EQ(revision.basedOn->documentId, parentId);
    RH_ASSERT_EQ(revision.basedOn->createdAt, Date::fromISO8601("2020-01-01T00:00:00Z"));

    // The translation is orphaned when its source revision is deleted.
    m_store->deleteRevision(sourceRevid);
    snapshot = m_store->getSnapshot("fr", "Web/HTML");
    RH_ASSERT_EQ(snapshot.revisions.size(), 1U);
    RH_ASSERT(snapshot.revisions[0].basedOn == nullptr);
  }

  RH_TEST_CASE(defaultCreationDate) {
    Date::setFrozenValueOfNow(Date(2021, 5, 4, 3, 2, 1));
    docid_t documentId = m_store->addDocument("fr", "Web/HTML");
    revid_t revid = m_store->addRevision({.documentId = documentId, .isApproved = true});
    vector<Revision> revisions = m_store->getRevisions(m_store->getDocument("fr", "Web/HTML"));
    RH_ASSERT_EQ(revisions.size(), 1U);
    RH_ASSERT_EQ(revisions[0].id, revid);
    RH_ASSERT_EQ(revisions[0].createdAt, Date(2021, 5, 4, 3, 2, 1));
    RH_ASSERT_EQ(revisions[0].creator, "");
  }

  RH_TEST_CASE(deleteMissingRevision) {
    docid_t documentId = m_store->addDocument("fr", "Web/HTML");
    revid_t revid = addRevision(documentId, "2020-01-01T00:00:00Z", true);
    m_store->deleteRevision(revid + 100);
    RH_ASSERT_EQ(m_store->getRevisions(m_store->getDocument("fr", "Web/HTML")).size(), 1U);
  }

  RH_TEST_CASE(reopenReadOnly) {
    docid_t documentId = m_store->addDocument("fr", "Web/HTML");
    addRevision(documentId, "2020-01-01T00:00:00Z", true);
    m_store.reset();

    SqliteRevisionStore store(m_tempFile->path());
    HistorySnapshot snapshot = store.getSnapshot("fr", "Web/HTML");
    RH_ASSERT_EQ(snapshot.revisions.size(), 1U);
    bool exceptionThrown = false;
    try {
      store.addDocument("de", "Web/HTML");
    } catch (const sqlite::SqliteError&) {
      exceptionThrown = true;
    }
    RH_ASSERT(exceptionThrown);
  }

  RH_TEST_CASE(openMissingDatabase) {
    bool exceptionThrown = false;
    try {
      SqliteRevisionStore store(m_tempFile->path() + ".missing");
    } catch (const rhbase::FileNotFoundError&) {
      exceptionThrown = true;
    }
    RH_ASSERT(exceptionThrown);
  }

  unique_ptr<TempFile> m_tempFile;
  unique_ptr<SqliteRevisionStore> m_store;
};

}  // namespace revhist

int main() {
  revhist::SqliteRevisionStoreTest().run();
  return 0;
}
