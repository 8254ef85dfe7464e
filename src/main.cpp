#include <exception>
#include <filesystem>

#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "content.hpp"
#include "maker.hpp"

DEFINE_string(dir, ".", "site directory, holding config.toml and the source tree");
DEFINE_string(config, "config.toml", "config file, relative to --dir");
DEFINE_bool(verbose, false, "enable debug logging");

DEFINE_string(test_post, "", "for test, to parse single post");

using namespace stele;

bool test_post(const std::string& post_file) {
  const path file_path{post_file};
  const auto kind = file_path.parent_path().filename() == "site" ? ContentKind::PAGES : ContentKind::POSTS;
  const auto unit = ContentUnit::parse(file_path, kind, utils::read_file_all(file_path));
  spdlog::info("title: {}", unit->title());
  spdlog::info("metadata: {}", unit->metadata().dump());
  spdlog::info("html:\n{}", unit->body());
  return true;
}

int main(int argc, char** argv) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  spdlog::set_level(FLAGS_verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::flush_on(spdlog::level::warn);
  try {
    // 单篇测试使用
    if (!FLAGS_test_post.empty()) {
      return test_post(FLAGS_test_post) ? 0 : -1;
    }
    //
    const auto origin_wd = current_path();
    current_path(absolute(FLAGS_dir));
    spdlog::info("change working dir from {} to {}", origin_wd.string(), current_path().string());
    // 加载解析配置
    const auto conf = load_config(FLAGS_config);
    // make
    const auto maker = std::make_shared<Maker>(conf);
    if (!maker->make()) {
      spdlog::error("failed to make!");
      return -1;
    }
    spdlog::info("success to make!");
  } catch (const std::exception& err) {
    spdlog::error("{}", err.what());
    return -1;
  }
  return 0;
}
