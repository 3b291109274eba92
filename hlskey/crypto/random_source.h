// Copyright 2016 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#ifndef HLSKEY_CRYPTO_RANDOM_SOURCE_H_
#define HLSKEY_CRYPTO_RANDOM_SOURCE_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include <hlskey/macros/classes.h>

namespace hlskey {

/// Source of cryptographically secure random bytes.
class RandomSource {
 public:
  virtual ~RandomSource();

  /// Fill @a buffer with @a size random bytes.
  /// @return true on success, false if the source failed. The content of
  ///         @a buffer is unspecified on failure.
  virtual bool GenerateRandomBytes(uint8_t* buffer, size_t size) = 0;

  /// Convenience wrapper which resizes @a bytes to @a size and fills it.
  bool GenerateRandomBytes(size_t size, std::vector<uint8_t>* bytes);

 protected:
  RandomSource();

 private:
  DISALLOW_COPY_AND_ASSIGN(RandomSource);
};

/// RandomSource backed by the mbedtls entropy collector, which reads the
/// platform entropy source.
class EntropyRandomSource : public RandomSource {
 public:
  EntropyRandomSource();
  ~EntropyRandomSource() override;

  bool GenerateRandomBytes(uint8_t* buffer, size_t size) override;
  using RandomSource::GenerateRandomBytes;

 private:
  DISALLOW_COPY_AND_ASSIGN(EntropyRandomSource);
};

}  // namespace hlskey

#endif  // HLSKEY_CRYPTO_RANDOM_SOURCE_H_
