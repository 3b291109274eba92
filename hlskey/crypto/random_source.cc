// Copyright 2016 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/crypto/random_source.h>

#include <algorithm>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <mbedtls/entropy.h>

namespace hlskey {

RandomSource::RandomSource() = default;
RandomSource::~RandomSource() = default;

bool RandomSource::GenerateRandomBytes(size_t size,
                                       std::vector<uint8_t>* bytes) {
  DCHECK(bytes);
  bytes->resize(size);
  return GenerateRandomBytes(bytes->data(), size);
}

EntropyRandomSource::EntropyRandomSource() = default;
EntropyRandomSource::~EntropyRandomSource() = default;

bool EntropyRandomSource::GenerateRandomBytes(uint8_t* buffer, size_t size) {
  DCHECK(buffer || size == 0);

  mbedtls_entropy_context entropy_ctx;
  mbedtls_entropy_init(&entropy_ctx);

  // mbedtls_entropy_func returns at most MBEDTLS_ENTROPY_BLOCK_SIZE bytes per
  // call.
  int rv = 0;
  size_t offset = 0;
  while (offset < size) {
    const size_t chunk_size =
        std::min<size_t>(size - offset, MBEDTLS_ENTROPY_BLOCK_SIZE);
    rv = mbedtls_entropy_func(&entropy_ctx, buffer + offset, chunk_size);
    if (rv != 0)
      break;
    offset += chunk_size;
  }
  mbedtls_entropy_free(&entropy_ctx);

  if (rv != 0) {
    LOG(ERROR) << "mbedtls_entropy_func failed with: " << rv;
    return false;
  }
  return true;
}

}  // namespace hlskey
