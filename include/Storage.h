/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      Storage.h / Storage.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Filesystem persistence helpers. Every persisted file (boot marker, info
 * signal, sync marker, synced artifacts) is written to a temp file next to
 * its destination and renamed into place, so readers never see a torn file.
 * =================================================================================
 */
#ifndef STORAGE_H
#define STORAGE_H

#include <stdint.h>
#include <string>

// =================================================================================
// SECTION: FILE PRIMITIVES
// =================================================================================
bool fileExists(const std::string &path);
bool isDirectory(const std::string &path);
bool readFileToString(const std::string &path, std::string &out, std::string &errorMsg);
bool writeFileAtomic(const std::string &path, const std::string &data, std::string &errorMsg);
bool removeFile(const std::string &path);

// =================================================================================
// SECTION: DIRECTORIES & PATHS
// =================================================================================
bool ensureDirectory(const std::string &path, std::string &errorMsg); // mkdir -p
bool ensureParentDirectory(const std::string &path, std::string &errorMsg);
std::string joinPath(const std::string &dir, const std::string &name);
std::string baseName(const std::string &path);

#endif
