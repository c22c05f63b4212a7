/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/ArtifactWriter.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <errno.h>
#include <string.h>
#include <unistd.h>

#include "ArtifactWriter.h"
#include "LogicUtils.h"
#include "Storage.h"
#include "WireCodec.h"

ArtifactWriter::~ArtifactWriter() { discardPartial(); }

void ArtifactWriter::closeAndRemove(PartialFile &f) {
  if (f.fp) {
    fclose(f.fp);
    f.fp = nullptr;
  }
  unlink(f.partPath.c_str());
}

bool ArtifactWriter::writeChunk(ArtifactId artifact, const char *relPath, uint64_t offset, const uint8_t *data,
                                size_t len, bool final, uint32_t checksum, std::string &errorMsg) {
  std::string rel = relPath ? relPath : "";
  if (artifact >= ARTIFACT_COUNT || !WireCodec::isSafeRelativePath(rel)) {
    errorMsg = "Refusing unsafe sync path '" + rel + "'";
    return false;
  }

  auto it = _open.find(rel);

  // A file restarted from zero replaces whatever was assembled so far
  if (it != _open.end() && offset == 0) {
    closeAndRemove(it->second);
    _open.erase(it);
    it = _open.end();
  }

  if (it == _open.end()) {
    if (offset != 0) {
      errorMsg = rel + ": chunk at offset " + std::to_string(offset) + " without start";
      return false;
    }

    PartialFile f;
    f.finalPath = joinPath(_root, rel);
    f.partPath = f.finalPath + ".part";
    f.written = 0;
    f.hash = LogicUtils::FNV_OFFSET;

    if (!ensureParentDirectory(f.finalPath, errorMsg)) return false;
    f.fp = fopen(f.partPath.c_str(), "wb");
    if (!f.fp) {
      errorMsg = f.partPath + ": " + strerror(errno);
      return false;
    }
    it = _open.insert(std::make_pair(rel, f)).first;
  }

  PartialFile &f = it->second;
  if (offset != f.written) {
    errorMsg = rel + ": expected offset " + std::to_string(f.written) + ", got " + std::to_string(offset);
    closeAndRemove(f);
    _open.erase(it);
    return false;
  }

  if (len > 0) {
    if (fwrite(data, 1, len, f.fp) != len) {
      errorMsg = f.partPath + ": " + strerror(errno);
      closeAndRemove(f);
      _open.erase(it);
      return false;
    }
    f.hash = LogicUtils::fnv1a(data, len, f.hash);
    f.written += len;
  }

  if (!final) return true;

  bool ok = fflush(f.fp) == 0 && fsync(fileno(f.fp)) == 0;
  ok = (fclose(f.fp) == 0) && ok;
  f.fp = nullptr;
  if (!ok) {
    errorMsg = f.partPath + ": " + strerror(errno);
  } else if (f.hash != checksum) {
    char buf[96];
    snprintf(buf, sizeof(buf), ": checksum mismatch (got %08X, expected %08X)", f.hash, checksum);
    errorMsg = rel + buf;
    ok = false;
  } else if (rename(f.partPath.c_str(), f.finalPath.c_str()) != 0) {
    errorMsg = f.finalPath + ": " + strerror(errno);
    ok = false;
  }

  if (!ok) unlink(f.partPath.c_str());
  else _completed++;
  _open.erase(it);
  return ok;
}

void ArtifactWriter::discardPartial() {
  for (auto &entry : _open) closeAndRemove(entry.second);
  _open.clear();
}
