#include "revision_store.h"
#include <string>
#include <utility>

using std::string;

namespace revhist {

HistorySnapshot RevisionStore::getSnapshot(const string& locale, const string& slug) {
  HistorySnapshot snapshot;
  snapshot.document = getDocument(locale, slug);
  snapshot.revisions = getRevisions(snapshot.document);
  return snapshot;
}

}  // namespace revhist
