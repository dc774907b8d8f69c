// Copyright (c) 2024 TimeChunk developers
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace timechunk {
namespace util {

namespace {

bool sync_path(const std::filesystem::path &path, int flags) {
  int fd = open(path.c_str(), flags);
  if (fd < 0) {
    return false;
  }
  bool ok = fsync(fd) == 0;
  close(fd);
  return ok;
}

std::string random_suffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

} // anonymous namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  {
    std::ofstream temp_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!temp_file) {
      return false;
    }
    temp_file.write(data.data(), static_cast<std::streamsize>(data.size()));
    temp_file.flush();
    if (!temp_file) {
      temp_file.close();
      std::filesystem::remove(temp_path);
      return false;
    }
  }

  if (!sync_path(temp_path, O_RDONLY)) {
    std::filesystem::remove(temp_path);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path);
    return false;
  }

  // Make the rename itself durable
  if (!parent.empty()) {
    sync_path(parent, O_RDONLY | O_DIRECTORY);
  }
  return true;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".timechunk";
  }
  return std::filesystem::current_path() / ".timechunk";
}

} // namespace util
} // namespace timechunk
