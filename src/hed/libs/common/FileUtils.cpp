#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <stdlib.h>
#include <stdio.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <errno.h>

#include <glibmm/fileutils.h>
#include <glibmm/miscutils.h>

#include "FileUtils.h"

namespace Aeat {

  // Closes descriptor keeping errno of failure which happened before
  static void close_keep_errno(int h) {
    int err = errno;
    ::close(h);
    errno = err;
  }

  static bool write_all(int h, const std::string& data) {
    std::string::size_type done = 0;
    while (done < data.length()) {
      ssize_t l = ::write(h, data.c_str() + done, data.length() - done);
      if (l < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      done += l;
    }
    return true;
  }

  bool FileRead(const std::string& filename, std::string& data) {
    data.clear();
    int h = ::open(filename.c_str(), O_RDONLY);
    if (h < 0) return false;
    char buf[4096];
    for (;;) {
      ssize_t l = ::read(h, buf, sizeof(buf));
      if (l == 0) break;
      if (l < 0) {
        if (errno == EINTR) continue;
        close_keep_errno(h);
        return false;
      }
      data.append(buf, l);
    }
    ::close(h);
    return true;
  }

  bool FileCreate(const std::string& filename, const std::string& data, mode_t mode) {
    // Readers never see partially written file
    std::string tmpname = filename + ".XXXXXX";
    if (!TmpFileCreate(tmpname, data, mode ? mode : (S_IRUSR|S_IWUSR|S_IRGRP|S_IROTH)))
      return false;
    if (::rename(tmpname.c_str(), filename.c_str()) != 0) {
      int err = errno;
      ::unlink(tmpname.c_str());
      errno = err;
      return false;
    }
    return true;
  }

  bool FileStat(const std::string& path, struct stat *st, bool follow_symlinks) {
    if (follow_symlinks) return (::stat(path.c_str(), st) == 0);
    return (::lstat(path.c_str(), st) == 0);
  }

  bool FileDelete(const std::string& path) {
    return (::unlink(path.c_str()) == 0);
  }

  bool DirCreate(const std::string& path, mode_t mode, bool with_parents) {
    if (::mkdir(path.c_str(), mode) == 0) {
      // mkdir applies umask
      return (::chmod(path.c_str(), mode) == 0);
    }
    if ((errno == ENOENT) && with_parents) {
      std::string parent = Glib::path_get_dirname(path);
      if ((parent != path) && DirCreate(parent, mode, true)) {
        if (::mkdir(path.c_str(), mode) == 0) return (::chmod(path.c_str(), mode) == 0);
      }
    }
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISDIR(st.st_mode)) {
      errno = ENOTDIR;
      return false;
    }
    errno = EEXIST;
    return true;
  }

  bool DirList(const std::string& path, std::list<std::string>& entries) {
    entries.clear();
    try {
      Glib::Dir dir(path);
      for (Glib::Dir::iterator name = dir.begin(); name != dir.end(); ++name)
        entries.push_back(*name);
    } catch (Glib::FileError&) {
      return false;
    }
    return true;
  }

  bool DirDelete(const std::string& path) {
    std::list<std::string> entries;
    if (!DirList(path, entries)) return false;
    for (std::list<std::string>::iterator e = entries.begin(); e != entries.end(); ++e) {
      std::string entry = Glib::build_filename(path, *e);
      struct stat st;
      if (!FileStat(entry, &st, false)) return false;
      bool removed = S_ISDIR(st.st_mode) ? DirDelete(entry) : FileDelete(entry);
      if (!removed) return false;
    }
    return (::rmdir(path.c_str()) == 0);
  }

  bool TmpDirCreate(std::string& path) {
    std::string name = Glib::build_filename(Glib::get_tmp_dir(), "aeat-XXXXXX");
    if (!::mkdtemp(&name[0])) return false;
    path = name;
    return true;
  }

  bool TmpFileCreate(std::string& filename, const std::string& data, mode_t mode) {
    static const std::string pattern("XXXXXX");
    if ((filename.length() < pattern.length()) ||
        (filename.compare(filename.length() - pattern.length(), pattern.length(), pattern) != 0)) {
      filename = Glib::build_filename(Glib::get_tmp_dir(), "aeat-XXXXXX");
    }
    int h = Glib::mkstemp(filename);
    if (h < 0) return false;
    bool ok = (::fchmod(h, mode ? mode : (S_IRUSR|S_IWUSR)) == 0) && write_all(h, data);
    if (!ok) {
      close_keep_errno(h);
    } else if (::close(h) != 0) {
      ok = false;
    }
    if (!ok) {
      int err = errno;
      ::unlink(filename.c_str());
      errno = err;
    }
    return ok;
  }

} // namespace Aeat
