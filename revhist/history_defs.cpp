#include "history_defs.h"
#include <string>

using std::string;

namespace revhist {

bool isCreatedBefore(const Revision& revision1, const Revision& revision2) {
  if (revision1.createdAt != revision2.createdAt) {
    return revision1.createdAt < revision2.createdAt;
  }
  return revision1.id < revision2.id;
}

string Document::path() const {
  return locale + "/docs/" + slug;
}

}  // namespace revhist
