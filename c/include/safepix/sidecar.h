// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

// Developer-mode transfer of worker code ahead of the document.
//
// A bundle is:
//   "SPXB" | uint32 archive_size | brotli(archive)
// where the archive is a sequence of
//   uint32 path_size | path | uint32 data_size | data
// All integers are big-endian. On the wire, the bundle is preceded by its own
// uint32 length.

#ifndef SAFEPIX_HOST_SIDECAR_H_
#define SAFEPIX_HOST_SIDECAR_H_

#include <string>
#include <vector>

#include <safepix/status.h>
#include <safepix/types.h>

namespace safepix {

struct BundleEntry {
  // Relative, '/'-separated path.
  std::string path;
  std::string data;
};

// Packs all regular files below |dir| into a compressed bundle.
SafepixStatus BundleDirectory(const std::string& dir,
                              std::vector<uint8_t>* bundle);

SafepixStatus BundleEntries(const std::vector<BundleEntry>& entries,
                            std::vector<uint8_t>* bundle);

// Unpacks a bundle produced by BundleDirectory / BundleEntries. Rejects
// absolute paths and paths containing "..".
SafepixStatus ExtractBundle(const uint8_t* data, size_t len,
                            std::vector<BundleEntry>* entries);

// Writes uint32 length of |payload| followed by |payload| to |fd|.
SafepixStatus TeleportPayload(int fd, const uint8_t* payload, size_t len);

}  // namespace safepix

#endif  // SAFEPIX_HOST_SIDECAR_H_
