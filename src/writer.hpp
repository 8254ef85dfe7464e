#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace stele {

using namespace std::filesystem;

// 输出目录下的文件写入；每个相对路径只属于一个处理单元
class Writer final {
public:
  explicit Writer(path out_root) : out_root_(std::move(out_root)) {}

  [[nodiscard]] const path& out_root() const {
    return out_root_;
  }

  void write(const std::string& relative_path, const std::string& content) const;
  void clean() const;
  void copy_public(const path& public_path) const;

private:
  void ensure_dir(const path& dir) const;

  path out_root_;
};

using WriterPtr = std::shared_ptr<Writer>;

inline void Writer::ensure_dir(const path& dir) const {
  std::error_code ec;
  create_directories(dir, ec);
  if (ec || !is_directory(dir)) {
    throw IOError(fmt::format("could not create directory {}: {}", dir.string(), ec.message()));
  }
}

inline void Writer::write(const std::string& relative_path, const std::string& content) const {
  const path file_path = out_root_ / relative_path;
  ensure_dir(file_path.parent_path());
  std::ofstream ofs{file_path, std::ios::binary | std::ios::trunc};
  if (!ofs.is_open()) {
    throw IOError(fmt::format("could not open output file: {}", file_path.string()));
  }
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  ofs.flush();
  if (!ofs) {
    throw IOError(fmt::format("failed to write output file: {}", file_path.string()));
  }
  spdlog::debug("wrote {}", file_path.string());
}

// 清空输出目录的内容，保留目录本身
inline void Writer::clean() const {
  if (exists(out_root_)) {
    for (const auto& entry : directory_iterator(out_root_)) {
      std::error_code ec;
      remove_all(entry.path(), ec);
      if (ec) {
        throw IOError(fmt::format("could not remove {}: {}", entry.path().string(), ec.message()));
      }
    }
  }
  ensure_dir(out_root_);
}

inline void Writer::copy_public(const path& public_path) const {
  if (!exists(public_path)) {
    spdlog::debug("no public directory: {}", public_path.string());
    return;
  }
  ensure_dir(out_root_);
  std::error_code ec;
  copy(public_path, out_root_, copy_options::recursive | copy_options::overwrite_existing, ec);
  if (ec) {
    throw IOError(fmt::format("could not copy {} to {}: {}", public_path.string(), out_root_.string(), ec.message()));
  }
}

}  // namespace stele
