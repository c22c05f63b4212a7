/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/SyncMarkerStore.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * JSON marker file that records a completed initial sync. Its presence
 * (with "synced": true) suppresses every later sync attempt.
 * =================================================================================
 */
#pragma once
#include <string>

#include "InitialSync.h"

class FileSyncMarkerStore : public ISyncMarkerStore {
public:
  explicit FileSyncMarkerStore(const std::string &path) : _path(path) {}

  bool load(SyncMarker &out) override;
  bool save(const SyncMarker &marker, std::string &errorMsg) override;
  bool remove() override;

  const std::string &getPath() const { return _path; }

private:
  std::string _path;
};
