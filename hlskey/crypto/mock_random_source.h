// Copyright 2018 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_CRYPTO_MOCK_RANDOM_SOURCE_H_
#define HLSKEY_CRYPTO_MOCK_RANDOM_SOURCE_H_

#include <cstdint>

#include <gmock/gmock.h>

#include <hlskey/crypto/random_source.h>

namespace hlskey {

class MockRandomSource : public RandomSource {
 public:
  MockRandomSource() {}

  MOCK_METHOD2(GenerateRandomBytes, bool(uint8_t* buffer, size_t size));
  using RandomSource::GenerateRandomBytes;
};

}  // namespace hlskey

#endif  // HLSKEY_CRYPTO_MOCK_RANDOM_SOURCE_H_
