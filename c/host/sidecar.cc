// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#include <safepix/sidecar.h>

#include <brotli/decode.h>
#include <brotli/encode.h>

#include "../common/constants.h"
#include "../common/file_util.h"
#include "../common/platform.h"

namespace safepix {

namespace {

const uint8_t kBundleSignature[] = {'S', 'P', 'X', 'B'};
const size_t kBundleSignatureSize = sizeof(kBundleSignature);
const size_t kBundleHeaderSize = kBundleSignatureSize + 4;
// Guards against decompression bombs.
const size_t kMaxArchiveSize = 256u << 20;

const int kBrotliQuality = 9;
const int kBrotliWindowBits = 22;

void AppendUint32(std::vector<uint8_t>* dst, uint32_t value) {
  uint8_t buf[4];
  SAFEPIX_STORE32BE(buf, value);
  Append(dst, buf, sizeof(buf));
}

bool IsSafeRelativePath(const std::string& path) {
  if (path.empty() || path[0] == '/') return false;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    std::string part = path.substr(start, end - start);
    if (part.empty() || part == "." || part == "..") return false;
    start = end + 1;
  }
  return true;
}

SafepixStatus Decompress(const uint8_t* data, size_t len, size_t expected_size,
                         std::vector<uint8_t>* out) {
  BrotliDecoderState* brotli =
      BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
  if (brotli == nullptr) return SAFEPIX_MEMORY_ERROR;
  const auto finish_decompression = [brotli](SafepixStatus result) {
    BrotliDecoderDestroyInstance(brotli);
    return result;
  };

  out->clear();
  size_t available_in = len;
  const uint8_t* next_in = data;
  while (true) {
    size_t available_out = 0;
    BrotliDecoderResult result = BrotliDecoderDecompressStream(
        brotli, &available_in, &next_in, &available_out, nullptr, nullptr);
    if (result == BROTLI_DECODER_RESULT_ERROR) {
      return finish_decompression(SAFEPIX_DECOMPRESSION_ERROR);
    }
    size_t chunk_size = 0;
    const uint8_t* chunk_data = BrotliDecoderTakeOutput(brotli, &chunk_size);
    if (out->size() + chunk_size > expected_size) {
      return finish_decompression(SAFEPIX_DECOMPRESSION_ERROR);
    }
    Append(out, chunk_data, chunk_size);
    if (result == BROTLI_DECODER_RESULT_SUCCESS) {
      if (available_in != 0 || out->size() != expected_size) {
        return finish_decompression(SAFEPIX_DECOMPRESSION_ERROR);
      }
      return finish_decompression(SAFEPIX_OK);
    }
    if (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) continue;
    // All the input was given at once; truncated stream.
    return finish_decompression(SAFEPIX_DECOMPRESSION_ERROR);
  }
}

}  // namespace

SafepixStatus BundleEntries(const std::vector<BundleEntry>& entries,
                            std::vector<uint8_t>* bundle) {
  std::vector<uint8_t> archive;
  for (size_t i = 0; i < entries.size(); ++i) {
    const BundleEntry& entry = entries[i];
    if (!IsSafeRelativePath(entry.path)) return SAFEPIX_INVALID_PARAM;
    if (entry.data.size() > 0xFFFFFFFFu) return SAFEPIX_INVALID_PARAM;
    AppendUint32(&archive, static_cast<uint32_t>(entry.path.size()));
    Append(&archive, reinterpret_cast<const uint8_t*>(entry.path.data()),
           entry.path.size());
    AppendUint32(&archive, static_cast<uint32_t>(entry.data.size()));
    Append(&archive, reinterpret_cast<const uint8_t*>(entry.data.data()),
           entry.data.size());
  }
  if (archive.size() > kMaxArchiveSize) return SAFEPIX_INVALID_PARAM;

  size_t compressed_size = BrotliEncoderMaxCompressedSize(archive.size());
  if (compressed_size == 0) return SAFEPIX_COMPRESSION_ERROR;
  bundle->resize(kBundleHeaderSize + compressed_size);
  uint8_t* header = bundle->data();
  memcpy(header, kBundleSignature, kBundleSignatureSize);
  SAFEPIX_STORE32BE(header + kBundleSignatureSize,
                    static_cast<uint32_t>(archive.size()));
  if (!BrotliEncoderCompress(kBrotliQuality, kBrotliWindowBits,
                             BROTLI_DEFAULT_MODE, archive.size(),
                             archive.data(), &compressed_size,
                             bundle->data() + kBundleHeaderSize)) {
    SAFEPIX_LOG_ERROR() << "Brotli compression failed:"
                        << " input size = " << archive.size()
                        << SAFEPIX_ENDL();
    bundle->clear();
    return SAFEPIX_COMPRESSION_ERROR;
  }
  bundle->resize(kBundleHeaderSize + compressed_size);
  return SAFEPIX_OK;
}

SafepixStatus BundleDirectory(const std::string& dir,
                              std::vector<uint8_t>* bundle) {
  std::vector<std::string> files;
  if (!ListFilesRecursively(dir, &files)) return SAFEPIX_IO_ERROR;
  std::vector<BundleEntry> entries(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    entries[i].path = files[i];
    if (!ReadFile(JoinPath(dir, files[i]), &entries[i].data)) {
      return SAFEPIX_IO_ERROR;
    }
  }
  SAFEPIX_LOG_DEBUG() << "Bundling " << entries.size() << " files from "
                      << dir << SAFEPIX_ENDL();
  return BundleEntries(entries, bundle);
}

SafepixStatus ExtractBundle(const uint8_t* data, size_t len,
                            std::vector<BundleEntry>* entries) {
  entries->clear();
  if (data == nullptr || len < kBundleHeaderSize) return SAFEPIX_INVALID_PARAM;
  if (memcmp(data, kBundleSignature, kBundleSignatureSize) != 0) {
    return SAFEPIX_INVALID_PARAM;
  }
  const size_t archive_size = SAFEPIX_LOAD32BE(data + kBundleSignatureSize);
  if (archive_size > kMaxArchiveSize) return SAFEPIX_DECOMPRESSION_ERROR;

  std::vector<uint8_t> archive;
  SafepixStatus status = Decompress(data + kBundleHeaderSize,
                                    len - kBundleHeaderSize, archive_size,
                                    &archive);
  if (status != SAFEPIX_OK) return status;

  size_t pos = 0;
  while (pos < archive.size()) {
    BundleEntry entry;
    for (int field = 0; field < 2; ++field) {
      if (archive.size() - pos < 4) return SAFEPIX_DECOMPRESSION_ERROR;
      size_t size = SAFEPIX_LOAD32BE(archive.data() + pos);
      pos += 4;
      if (archive.size() - pos < size) return SAFEPIX_DECOMPRESSION_ERROR;
      std::string& target = (field == 0) ? entry.path : entry.data;
      target.assign(reinterpret_cast<const char*>(archive.data() + pos), size);
      pos += size;
    }
    if (!IsSafeRelativePath(entry.path)) return SAFEPIX_DECOMPRESSION_ERROR;
    entries->push_back(entry);
  }
  return SAFEPIX_OK;
}

SafepixStatus TeleportPayload(int fd, const uint8_t* payload, size_t len) {
  if (fd < 0 || (payload == nullptr && len != 0)) return SAFEPIX_INVALID_PARAM;
  if (len > 0xFFFFFFFFu) return SAFEPIX_INVALID_PARAM;
  uint8_t length[kSidecarLengthSize];
  SAFEPIX_STORE32BE(length, static_cast<uint32_t>(len));
  if (!WriteToFd(fd, length, sizeof(length)) || !WriteToFd(fd, payload, len)) {
    SAFEPIX_LOG_ERROR() << "Failed to send sidecar payload" << SAFEPIX_ENDL();
    return SAFEPIX_IO_ERROR;
  }
  return SAFEPIX_OK;
}

}  // namespace safepix
