// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include "./file_util.h"

#include <dirent.h>
#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>

#include "./platform.h"

namespace safepix {

namespace {

bool ReadFileInternal(FILE* file, std::string* content) {
  if (fseek(file, 0, SEEK_END) != 0) {
    SAFEPIX_LOG_ERROR() << "Failed to seek end of input file."
                        << SAFEPIX_ENDL();
    return false;
  }
  long input_size = ftell(file);  // NOLINT(runtime/int)
  if (input_size < 0) {
    SAFEPIX_LOG_ERROR() << "Failed to get input file size." << SAFEPIX_ENDL();
    return false;
  }
  if (fseek(file, 0, SEEK_SET) != 0) {
    SAFEPIX_LOG_ERROR() << "Failed to rewind input file to the beginning."
                        << SAFEPIX_ENDL();
    return false;
  }
  content->resize(static_cast<size_t>(input_size));
  size_t read_pos = 0;
  while (read_pos < content->size()) {
    const size_t bytes_read =
        fread(&content->at(read_pos), 1, content->size() - read_pos, file);
    if (bytes_read == 0) {
      SAFEPIX_LOG_ERROR() << "Failed to read input file" << SAFEPIX_ENDL();
      return false;
    }
    read_pos += bytes_read;
  }
  return true;
}

bool WriteFileInternal(FILE* file, const uint8_t* data, size_t len) {
  size_t write_pos = 0;
  while (write_pos < len) {
    const size_t bytes_written =
        fwrite(data + write_pos, 1, len - write_pos, file);
    if (bytes_written == 0) {
      SAFEPIX_LOG_ERROR() << "Failed to write output." << SAFEPIX_ENDL();
      return false;
    }
    write_pos += bytes_written;
  }
  return true;
}

bool RemoveRecursively(const std::string& path) {
  struct stat st;
  if (lstat(path.c_str(), &st) != 0) return errno == ENOENT;
  if (!S_ISDIR(st.st_mode)) return unlink(path.c_str()) == 0;

  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) return false;
  bool ok = true;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    ok = RemoveRecursively(JoinPath(path, name)) && ok;
  }
  closedir(dir);
  return ok && rmdir(path.c_str()) == 0;
}

bool ListInto(const std::string& root, const std::string& relative,
              std::vector<std::string>* files) {
  const std::string path = relative.empty() ? root : JoinPath(root, relative);
  DIR* dir = opendir(path.c_str());
  if (dir == nullptr) {
    SAFEPIX_LOG_ERROR() << "Failed to open directory " << path
                        << SAFEPIX_ENDL();
    return false;
  }
  bool ok = true;
  while (struct dirent* entry = readdir(dir)) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    std::string child = relative.empty() ? name : JoinPath(relative, name);
    struct stat st;
    if (lstat(JoinPath(root, child).c_str(), &st) != 0) {
      ok = false;
      break;
    }
    if (S_ISDIR(st.st_mode)) {
      if (!ListInto(root, child, files)) {
        ok = false;
        break;
      }
    } else if (S_ISREG(st.st_mode)) {
      files->push_back(child);
    }
    // Symlinks and special files are skipped.
  }
  closedir(dir);
  return ok;
}

}  // namespace

std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir[dir.size() - 1] == '/') return dir + name;
  return dir + "/" + name;
}

bool ReadFile(const std::string& file_name, std::string* content) {
  FILE* file = fopen(file_name.c_str(), "rb");
  if (file == nullptr) {
    SAFEPIX_LOG_ERROR() << "Failed to open " << file_name << SAFEPIX_ENDL();
    return false;
  }
  bool ok = ReadFileInternal(file, content);
  if (fclose(file) != 0) {
    if (ok) {
      SAFEPIX_LOG_ERROR() << "Failed to close " << file_name << SAFEPIX_ENDL();
    }
    return false;
  }
  return ok;
}

bool WriteFile(const std::string& file_name, const uint8_t* data, size_t len) {
  FILE* file = fopen(file_name.c_str(), "wb");
  if (file == nullptr) {
    SAFEPIX_LOG_ERROR() << "Failed to open " << file_name << " for writing."
                        << SAFEPIX_ENDL();
    return false;
  }
  bool ok = WriteFileInternal(file, data, len);
  if (fclose(file) != 0) {
    if (ok) {
      SAFEPIX_LOG_ERROR() << "Failed to close " << file_name << SAFEPIX_ENDL();
    }
    return false;
  }
  return ok;
}

bool WriteFile(const std::string& file_name, const std::string& content) {
  return WriteFile(file_name, reinterpret_cast<const uint8_t*>(content.data()),
                   content.size());
}

bool WriteToFd(int fd, const uint8_t* data, size_t len) {
  size_t written = 0;
  while (written < len) {
    ssize_t result = write(fd, data + written, len - written);
    if (result < 0) {
      if (errno == EINTR) continue;
      SAFEPIX_LOG_ERROR() << "Write failed: " << strerror(errno)
                          << SAFEPIX_ENDL();
      return false;
    }
    written += static_cast<size_t>(result);
  }
  return true;
}

bool FileExists(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

bool GetFileSize(const std::string& path, uint64_t* size) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return false;
  *size = static_cast<uint64_t>(st.st_size);
  return true;
}

bool RemoveFileIfExists(const std::string& path) {
  if (unlink(path.c_str()) == 0) return true;
  return errno == ENOENT;
}

bool ResetDirectory(const std::string& path) {
  if (!RemoveRecursively(path)) {
    SAFEPIX_LOG_ERROR() << "Failed to remove " << path << SAFEPIX_ENDL();
    return false;
  }
  if (mkdir(path.c_str(), 0700) != 0) {
    SAFEPIX_LOG_ERROR() << "Failed to create " << path << ": "
                        << strerror(errno) << SAFEPIX_ENDL();
    return false;
  }
  return true;
}

bool MoveFile(const std::string& from, const std::string& to) {
  if (rename(from.c_str(), to.c_str()) == 0) return true;
  if (errno != EXDEV) {
    SAFEPIX_LOG_ERROR() << "Failed to move " << from << " to " << to << ": "
                        << strerror(errno) << SAFEPIX_ENDL();
    return false;
  }
  std::string content;
  if (!ReadFile(from, &content)) return false;
  if (!WriteFile(to, content)) return false;
  return unlink(from.c_str()) == 0;
}

bool ListFilesRecursively(const std::string& root,
                          std::vector<std::string>* files) {
  files->clear();
  if (!ListInto(root, std::string(), files)) return false;
  std::sort(files->begin(), files->end());
  return true;
}

}  // namespace safepix
