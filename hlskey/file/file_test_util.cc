// Copyright 2022 Google LLC. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file or at
// https://developers.google.com/open-source/licenses/bsd

#include <hlskey/file/file_test_util.h>

#include <stdlib.h>
#include <unistd.h>

#include <filesystem>

namespace hlskey {

std::string generate_unique_temp_path() {
  // Generate a unique name for a temporary file, using standard library
  // routines, to avoid a circular dependency on any of our own code for
  // generating temporary files.  The template must end in 6 X's.
  auto temp_path_template =
      std::filesystem::temp_directory_path() / "hlskey-test.XXXXXX";
  std::string temp_path_template_string = temp_path_template.string();
  // mkstemp will create and open the file, modify the character points to
  // reflect the generated name (replacing the X characters with something
  // else), and return an open file descriptor.  Then we close it and use the
  // generated name.
  int fd = mkstemp(temp_path_template_string.data());
  close(fd);
  return temp_path_template_string;
}

TempFile::TempFile() : path_(generate_unique_temp_path()) {}

TempFile::~TempFile() {
  std::error_code ec;
  std::filesystem::remove(std::filesystem::u8path(path_), ec);
  // Ignore errors.
}

TempDirectory::TempDirectory() {
  auto temp_dir_template =
      std::filesystem::temp_directory_path() / "hlskey-test-dir.XXXXXX";
  std::string temp_dir_template_string = temp_dir_template.string();
  if (mkdtemp(temp_dir_template_string.data()) != NULL)
    path_ = temp_dir_template_string;
}

TempDirectory::~TempDirectory() {
  if (path_.empty())
    return;
  std::error_code ec;
  std::filesystem::remove_all(std::filesystem::u8path(path_), ec);
  // Ignore errors.
}

size_t TempDirectory::CountEntries() const {
  std::error_code ec;
  size_t count = 0;
  for (std::filesystem::directory_iterator it(std::filesystem::u8path(path_),
                                              ec), end;
       !ec && it != end; it.increment(ec)) {
    ++count;
  }
  return count;
}

}  // namespace hlskey
