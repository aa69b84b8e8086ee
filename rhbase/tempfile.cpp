#include "tempfile.h"
#include <errno.h>
#include <unistd.h>
#include <cstdlib>
#include <string>
#include "error.h"
#include "log.h"

namespace rhbase {

TempFile::TempFile() : m_path("/tmp/revhistXXXXXX") {
  int fd = mkstemp(m_path.data());
  if (fd == -1) {
    throw SystemError("mkstemp", errno);
  }
  close(fd);
}

TempFile::~TempFile() {
  // The file may already have been removed by the test.
  if (unlink(m_path.c_str()) != 0) {
    int savedErrno = errno;
    if (savedErrno != ENOENT) {
      RH_ERROR << SystemError("unlink('" + m_path + "')", savedErrno).what();
    }
  }
}

}  // namespace rhbase
