#ifndef __AEAT_FILEUTILS_H__
#define __AEAT_FILEUTILS_H__

#include <string>
#include <list>

#include <sys/types.h>
#include <sys/stat.h>

namespace Aeat {

  // Utility functions for handling files and directories.
  // On failure they return false and leave errno set by the failed
  // system call so that callers can report it with StrError().

  /** \addtogroup common
   *  @{ */

  /// Simple method to read whole file content from filename.
  bool FileRead(const std::string& filename, std::string& data);

  /// Simple method to create a new file containing given data.
  /** An existing file is overwritten. The content is first written into
   * temporary file which is then renamed to filename. If mode is 0 then
   * it is set to 0644. */
  bool FileCreate(const std::string& filename, const std::string& data, mode_t mode = 0);

  /// Stat a file and put info into the st struct
  bool FileStat(const std::string& path, struct stat *st, bool follow_symlinks);

  /// Deletes file at path.
  bool FileDelete(const std::string& path);

  /// Create a new directory.
  /** If with_parents is true then missing parent directories are created
   * too. Existing directory is treated as success. */
  bool DirCreate(const std::string& path, mode_t mode, bool with_parents = false);

  /// List names of entries in directory path, excluding . and ..
  bool DirList(const std::string& path, std::list<std::string>& entries);

  /// Delete a directory and its content.
  bool DirDelete(const std::string& path);

  /// Create a temporary directory under the system defined temp location, and return its path.
  /** Uses mkdtemp. The directory is accessible only by its owner. */
  bool TmpDirCreate(std::string& path);

  /// Simple method to create a temporary file containing given data.
  /** If filename does not end with XXXXXX then a name under the system
   * defined temp location is generated. Otherwise filename is used as
   * template. The created file name is returned in filename.
   * If mode is 0 then file is accessible only by its owner. On any
   * failure no file is left behind. */
  bool TmpFileCreate(std::string& filename, const std::string& data, mode_t mode = 0);

  /** @} */

} // namespace Aeat

#endif // __AEAT_FILEUTILS_H__
