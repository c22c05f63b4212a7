/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/ArtifactWriter.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Writes synced files below the remote's local root. Each file is assembled
 * in '<path>.part' and renamed into place once its final chunk verified.
 * =================================================================================
 */
#pragma once
#include <map>
#include <stdio.h>
#include <string>

#include "InitialSync.h"

class ArtifactWriter : public ISyncSink {
public:
  explicit ArtifactWriter(const std::string &localRoot) : _root(localRoot), _completed(0) {}
  ~ArtifactWriter();

  bool writeChunk(ArtifactId artifact, const char *relPath, uint64_t offset, const uint8_t *data, size_t len,
                  bool final, uint32_t checksum, std::string &errorMsg) override;
  void discardPartial() override;

  uint32_t getCompletedFiles() const { return _completed; }

private:
  struct PartialFile {
    FILE *fp;
    std::string partPath;
    std::string finalPath;
    uint64_t written;
    uint32_t hash;
  };

  std::string _root;
  std::map<std::string, PartialFile> _open;
  uint32_t _completed;

  void closeAndRemove(PartialFile &f);
};
