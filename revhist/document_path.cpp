#include "document_path.h"
#include <re2/re2.h>
#include <string>

using std::string;

namespace revhist {

static const re2::RE2& localePattern() {
  static const re2::RE2 reLocale(R"([a-z]{2,3}(?:-[A-Za-z]{2,4})?)");
  return reLocale;
}

bool isValidLocale(const string& locale) {
  return re2::RE2::FullMatch(locale, localePattern());
}

DocumentPath parseDocumentPath(const string& path, const string& localeOverride) {
  // Slugs are made of non-empty segments separated by '/'. A trailing '/' is ignored.
  static const re2::RE2 reDocumentPath(R"(/?([^/\s]+)/docs/([^/\s?#]+(?:/[^/\s?#]+)*)/?)");
  DocumentPath documentPath;
  if (!re2::RE2::FullMatch(path, reDocumentPath, &documentPath.locale, &documentPath.slug)) {
    throw InvalidDocumentPathError("Invalid document path '" + path + "'");
  }
  if (!localeOverride.empty()) {
    documentPath.locale = localeOverride;
  }
  if (!isValidLocale(documentPath.locale)) {
    throw InvalidDocumentPathError("Invalid locale '" + documentPath.locale + "' for document path '" + path + "'");
  }
  return documentPath;
}

}  // namespace revhist
