/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      Storage.h / Storage.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "Storage.h"

// =================================================================================
// SECTION: FILE PRIMITIVES
// =================================================================================

bool fileExists(const std::string &path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool isDirectory(const std::string &path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool readFileToString(const std::string &path, std::string &out, std::string &errorMsg) {
  FILE *f = fopen(path.c_str(), "rb");
  if (!f) {
    errorMsg = path + ": " + strerror(errno);
    return false;
  }

  out.clear();
  char buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
    out.append(buf, n);
  }

  bool ok = !ferror(f);
  if (!ok) errorMsg = path + ": read error";
  fclose(f);
  return ok;
}

/**
 * Writes 'data' to '<path>.tmp', fsyncs it and renames it over 'path'.
 */
bool writeFileAtomic(const std::string &path, const std::string &data, std::string &errorMsg) {
  if (!ensureParentDirectory(path, errorMsg)) return false;

  std::string tmp = path + ".tmp";
  int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    errorMsg = tmp + ": " + strerror(errno);
    return false;
  }

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      errorMsg = tmp + ": " + strerror(errno);
      close(fd);
      unlink(tmp.c_str());
      return false;
    }
    written += (size_t)n;
  }

  if (fsync(fd) != 0 || close(fd) != 0) {
    errorMsg = tmp + ": " + strerror(errno);
    unlink(tmp.c_str());
    return false;
  }

  if (rename(tmp.c_str(), path.c_str()) != 0) {
    errorMsg = path + ": " + strerror(errno);
    unlink(tmp.c_str());
    return false;
  }
  return true;
}

bool removeFile(const std::string &path) {
  if (unlink(path.c_str()) == 0) return true;
  return errno == ENOENT;
}

// =================================================================================
// SECTION: DIRECTORIES & PATHS
// =================================================================================

bool ensureDirectory(const std::string &path, std::string &errorMsg) {
  if (path.empty() || isDirectory(path)) return true;

  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find('/', pos + 1);
    std::string part = path.substr(0, pos);
    if (part.empty() || isDirectory(part)) continue;
    if (mkdir(part.c_str(), 0755) != 0 && errno != EEXIST) {
      errorMsg = part + ": " + strerror(errno);
      return false;
    }
  }
  return true;
}

bool ensureParentDirectory(const std::string &path, std::string &errorMsg) {
  size_t slash = path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) return true;
  return ensureDirectory(path.substr(0, slash), errorMsg);
}

std::string joinPath(const std::string &dir, const std::string &name) {
  if (dir.empty()) return name;
  if (dir[dir.size() - 1] == '/') return dir + name;
  return dir + "/" + name;
}

std::string baseName(const std::string &path) {
  std::string p = path;
  while (p.size() > 1 && p[p.size() - 1] == '/') p.erase(p.size() - 1);
  size_t slash = p.find_last_of('/');
  return (slash == std::string::npos) ? p : p.substr(slash + 1);
}
