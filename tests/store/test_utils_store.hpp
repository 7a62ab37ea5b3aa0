#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

#include "clipscan/util/util.hpp"

namespace teststore {
  // Fresh directory under the system temp dir, removed recursively on scope exit.
  class TempDir {
  public:
    explicit TempDir(std::string stem = "clipscan_store") {
      auto dir = std::filesystem::temp_directory_path();
      path_ = dir / (stem + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter_++));
      std::filesystem::create_directories(path_);
    }

    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path &path() const { return path_; }
    std::string str() const { return path_.string(); }

    // Write `text` to `rel` below the directory, creating parents.
    std::string write(const std::string &rel, const std::string &text) const {
      const auto p = path_ / rel;
      std::filesystem::create_directories(p.parent_path());
      std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
      ofs << text;
      return p.string();
    }

  private:
    inline static std::atomic<uint64_t> counter_{0};
    std::filesystem::path path_;
  };

  // `fpcalc -raw` style output for the given words.
  inline std::string fpcalc_text(const std::vector<uint32_t> &words, uint32_t duration = 120) {
    std::string s = "DURATION=" + std::to_string(duration) + "\nFINGERPRINT=";
    for (size_t i = 0; i < words.size(); ++i) {
      if (i) s += ',';
      s += std::to_string(words[i]);
    }
    s += '\n';
    return s;
  }

  inline std::vector<uint32_t> words_of(const clipscan::util::Fingerprint &fp) {
    return std::vector<uint32_t>(fp.begin(), fp.end());
  }

  inline std::vector<uint32_t> words_of(clipscan::util::FingerprintView fp) {
    return std::vector<uint32_t>(fp.begin(), fp.end());
  }
} // namespace teststore
