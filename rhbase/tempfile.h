#ifndef RHBASE_TEMPFILE_H
#define RHBASE_TEMPFILE_H

#include <string>

namespace rhbase {

// Empty file in /tmp, removed when the object is destroyed.
class TempFile {
public:
  TempFile();
  TempFile(const TempFile&) = delete;
  ~TempFile();
  TempFile& operator=(const TempFile&) = delete;
  const std::string& path() const { return m_path; }

private:
  std::string m_path;
};

}  // namespace rhbase

#endif
