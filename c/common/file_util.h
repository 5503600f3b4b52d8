// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

// Filesystem helpers shared by the staging area, the assembler and tools.

#ifndef SAFEPIX_COMMON_FILE_UTIL_H_
#define SAFEPIX_COMMON_FILE_UTIL_H_

#include <string>
#include <vector>

#include <safepix/types.h>

namespace safepix {

bool ReadFile(const std::string& file_name, std::string* content);
bool WriteFile(const std::string& file_name, const std::string& content);
bool WriteFile(const std::string& file_name, const uint8_t* data, size_t len);

// Writes all of |data| to |fd|, retrying on partial writes and EINTR.
bool WriteToFd(int fd, const uint8_t* data, size_t len);

bool FileExists(const std::string& path);
bool GetFileSize(const std::string& path, uint64_t* size);

// Removes |path| if it exists; returns false only on a failed removal.
bool RemoveFileIfExists(const std::string& path);

// Recursively removes |path| (if present) and creates it empty.
bool ResetDirectory(const std::string& path);

// Renames |from| to |to|, falling back to copy + remove across filesystems.
bool MoveFile(const std::string& from, const std::string& to);

// Lists regular files below |root|, as paths relative to it, sorted.
bool ListFilesRecursively(const std::string& root,
                          std::vector<std::string>* files);

std::string JoinPath(const std::string& dir, const std::string& name);

}  // namespace safepix

#endif  // SAFEPIX_COMMON_FILE_UTIL_H_
