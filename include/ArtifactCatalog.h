/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/ArtifactCatalog.h
 * Description:
 * Target-side map from ArtifactId to the files that make it up. File
 * artifacts (database, config) must exist; directory artifacts may be absent
 * and then contribute no files. Relative paths are prefixed with the base
 * name of the artifact's root so the remote can mirror the layout.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>

#include "AppTypes.h"

struct ArtifactFile {
  std::string absPath;
  std::string relPath;
  uint64_t size;
};

class ArtifactCatalog {
public:
  explicit ArtifactCatalog(const TargetSettings &settings);

  bool listFiles(ArtifactId artifact, std::vector<ArtifactFile> &out, std::string &errorMsg) const;
  const std::string &rootOf(ArtifactId artifact) const;
  bool isDirectoryArtifact(ArtifactId artifact) const;

private:
  std::string _roots[ARTIFACT_COUNT];

  bool walk(const std::string &absDir, const std::string &relDir, std::vector<ArtifactFile> &out,
            std::string &errorMsg) const;
};
