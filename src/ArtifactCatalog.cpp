/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/ArtifactCatalog.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <algorithm>
#include <dirent.h>
#include <errno.h>
#include <string.h>
#include <sys/stat.h>

#include "ArtifactCatalog.h"
#include "Storage.h"

ArtifactCatalog::ArtifactCatalog(const TargetSettings &settings) {
  _roots[ARTIFACT_DATABASE] = settings.databasePath;
  _roots[ARTIFACT_CONFIG] = settings.configPath;
  _roots[ARTIFACT_PICTURES] = settings.picturesDir;
  _roots[ARTIFACT_MODELS] = settings.modelsDir;
  _roots[ARTIFACT_LABELSTUDIO] = settings.labelstudioDir;
}

const std::string &ArtifactCatalog::rootOf(ArtifactId artifact) const { return _roots[artifact]; }

bool ArtifactCatalog::isDirectoryArtifact(ArtifactId artifact) const {
  return artifact == ARTIFACT_PICTURES || artifact == ARTIFACT_MODELS || artifact == ARTIFACT_LABELSTUDIO;
}

bool ArtifactCatalog::listFiles(ArtifactId artifact, std::vector<ArtifactFile> &out, std::string &errorMsg) const {
  out.clear();
  if (artifact >= ARTIFACT_COUNT) {
    errorMsg = "Unknown artifact";
    return false;
  }

  const std::string &root = _roots[artifact];
  if (!isDirectoryArtifact(artifact)) {
    struct stat st;
    if (stat(root.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
      errorMsg = std::string(artifactToString(artifact)) + " missing: " + root;
      return false;
    }
    ArtifactFile f;
    f.absPath = root;
    f.relPath = baseName(root);
    f.size = (uint64_t)st.st_size;
    out.push_back(f);
    return true;
  }

  if (!isDirectory(root)) return true;
  if (!walk(root, baseName(root), out, errorMsg)) return false;

  // Stable order for reproducible checksums
  std::sort(out.begin(), out.end(),
            [](const ArtifactFile &a, const ArtifactFile &b) { return a.relPath < b.relPath; });
  return true;
}

bool ArtifactCatalog::walk(const std::string &absDir, const std::string &relDir, std::vector<ArtifactFile> &out,
                           std::string &errorMsg) const {
  DIR *dir = opendir(absDir.c_str());
  if (!dir) {
    errorMsg = absDir + ": " + strerror(errno);
    return false;
  }

  bool ok = true;
  struct dirent *entry;
  while (ok && (entry = readdir(dir)) != nullptr) {
    if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) continue;

    std::string abs = joinPath(absDir, entry->d_name);
    std::string rel = joinPath(relDir, entry->d_name);

    struct stat st;
    if (lstat(abs.c_str(), &st) != 0) continue;

    if (S_ISDIR(st.st_mode)) {
      ok = walk(abs, rel, out, errorMsg);
    } else if (S_ISREG(st.st_mode)) {
      ArtifactFile f;
      f.absPath = abs;
      f.relPath = rel;
      f.size = (uint64_t)st.st_size;
      out.push_back(f);
    }
    // Symlinks and special files are not synced
  }

  closedir(dir);
  return ok;
}
