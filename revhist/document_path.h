#ifndef REVHIST_DOCUMENT_PATH_H
#define REVHIST_DOCUMENT_PATH_H

#include <string>
#include "rhbase/error.h"

namespace revhist {

class InvalidDocumentPathError : public rhbase::ParseError {
public:
  using ParseError::ParseError;
};

struct DocumentPath {
  std::string locale;
  std::string slug;
};

// Splits a path such as "fr/docs/Web/HTML" or "/fr/docs/Web/HTML/" into its locale ("fr") and its slug ("Web/HTML").
// If localeOverride is not empty, it replaces the locale of the path.
// Throws: InvalidDocumentPathError.
DocumentPath parseDocumentPath(const std::string& path, const std::string& localeOverride = std::string());

// Returns true for locales such as "fr", "ast", "en-US" or "zh-Hant".
bool isValidLocale(const std::string& locale);

}  // namespace revhist

#endif
