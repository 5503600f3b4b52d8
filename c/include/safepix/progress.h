// Copyright (c) Google LLC 2019
//
// Use of this source code is governed by an MIT-style
// license that can be found in the LICENSE file or at
// https://opensource.org/licenses/MIT.

#ifndef SAFEPIX_COMMON_PROGRESS_H_
#define SAFEPIX_COMMON_PROGRESS_H_

#include <functional>
#include <string>

namespace safepix {

class Document;

// Session-level progress sink: (is_error, message, percentage).
typedef std::function<void(bool, const std::string&, double)> ProgressCallback;

// Progress sink exposed to callers of Convert.
typedef std::function<void(Document*, bool, const std::string&, double)>
    ProgressReporter;

}  // namespace safepix

#endif  // SAFEPIX_COMMON_PROGRESS_H_
