/* Copyright (c) Google LLC 2019

   Use of this source code is governed by an MIT-style
   license that can be found in the LICENSE file or at
   https://opensource.org/licenses/MIT.
*/

/* Common types */

#ifndef SAFEPIX_COMMON_TYPES_H_
#define SAFEPIX_COMMON_TYPES_H_

#include <stddef.h>  /* for size_t */
#include <stdint.h>

#endif /* SAFEPIX_COMMON_TYPES_H_ */
