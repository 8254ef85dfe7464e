#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "aggregate/archives.hpp"
#include "aggregate/listing.hpp"
#include "aggregate/paginator.hpp"
#include "aggregate/tags.hpp"
#include "config.hpp"
#include "content.hpp"
#include "errors.hpp"
#include "feed/rss.hpp"
#include "feed/sitemap.hpp"
#include "template/template.hpp"
#include "url.hpp"
#include "utils/executor.hpp"
#include "utils/perf.hpp"
#include "writer.hpp"

namespace stele {

static auto TAGS_INDEX_FILE = "tags/index.html";
static auto ARCHIVES_INDEX_FILE = "archives/index.html";
static auto RSS_FEED_FILE = "rss-feed";
static auto SITEMAP_FILE = "sitemap.xml";
static auto SITE_INDEX_FILE = "index.html";

// 聚合任务：标签、归档、分页列表、RSS、sitemap，各自在一个工作线程上顺序完成
class AggregateJob {
public:
  std::string name;
  std::function<void()> run;
};

// Maker
class Maker final {
public:
  explicit Maker(ConfigPtr conf);

  // 有任何单元失败时返回 false；配置错误和写入错误直接抛出
  bool make();

  [[nodiscard]] const std::vector<UnitResult>& failures() const {
    return failures_;
  }
  [[nodiscard]] const std::vector<ContentUnitPtr>& posts() const {
    return posts_;
  }
  [[nodiscard]] const std::vector<ContentUnitPtr>& pages() const {
    return pages_;
  }

private:
  void load();
  void load_kind(ContentKind kind, std::vector<ContentUnitPtr>& units);
  void prepare();
  void render_units();
  void make_aggregates();
  //
  [[nodiscard]] UnitResult render_post(const ContentUnitPtr& post) const;
  [[nodiscard]] UnitResult render_page(const ContentUnitPtr& page) const;
  [[nodiscard]] UnitResult guarded(const std::string& name, const std::function<void()>& fn) const;
  [[nodiscard]] Metadata listing_metadata(const std::string& title) const;
  void write_listing(const std::string& relative_path, const std::string& title, const std::string& content) const;
  //
  void make_tags() const;
  void make_archives() const;
  void make_latest_posts() const;
  void make_rss() const;
  void make_sitemap() const;

private:
  ConfigPtr conf_;
  SourceLayout layout_;
  ContentStore store_;
  UrlResolver resolver_;
  TemplateEnginePtr engine_;
  WriterPtr writer_;
  std::unique_ptr<utils::Executor> executor_;
  //
  std::vector<ContentUnitPtr> posts_;
  std::vector<ContentUnitPtr> pages_;
  std::vector<UnitResult> failures_;
};

using MakerPtr = std::shared_ptr<Maker>;

inline Maker::Maker(ConfigPtr conf)
    : conf_(std::move(conf)),
      layout_(conf_->layout()),
      store_(layout_),
      resolver_(conf_->post_out_subdir, layout_.pages_path_) {
  auto store = std::make_shared<TemplateStore>(layout_.templates_path_);
  engine_ = std::make_shared<TemplateEngine>(store, conf_->default_template);
  writer_ = std::make_shared<Writer>(path(conf_->out_dir));
  const unsigned int worker_num = conf_->worker_num == 0 ? utils::default_worker_num() : conf_->worker_num;
  executor_ = std::make_unique<utils::Executor>("render", 1024, worker_num);
}

inline void Maker::load_kind(const ContentKind kind, std::vector<ContentUnitPtr>& units) {
  for (const auto& file_path : store_.list(kind)) {
    try {
      units.emplace_back(store_.read(file_path, kind));
    } catch (const ContentParseError& err) {
      spdlog::error("failed to parse {}", err.what());
      failures_.emplace_back(UnitResult::failure(file_path.string(), err.what()));
    }
  }
}

inline void Maker::load() {
  utils::ScopedTimer timer("load");
  load_kind(ContentKind::POSTS, posts_);
  load_kind(ContentKind::PAGES, pages_);
  spdlog::info("successfully loaded {} posts and {} pages", posts_.size(), pages_.size());
}

// 先确认所有模板都可用，再清理输出目录
inline void Maker::prepare() {
  utils::ScopedTimer timer("prepare");
  conf_->validate();
  engine_->preload(Metadata::object());
  for (const auto& unit : posts_) {
    engine_->preload(unit->metadata());
  }
  for (const auto& unit : pages_) {
    engine_->preload(unit->metadata());
  }
  writer_->clean();
  writer_->copy_public(layout_.public_path_);
}

// 单元级错误记录后继续，写入错误直接上抛
inline UnitResult Maker::guarded(const std::string& name, const std::function<void()>& fn) const {
  try {
    fn();
  } catch (const IOError&) {
    throw;
  } catch (const Error& err) {
    spdlog::error("failed to make {}: {}", name, err.what());
    return UnitResult::failure(name, err.what());
  }
  return UnitResult::success(name);
}

inline UnitResult Maker::render_post(const ContentUnitPtr& post) const {
  return guarded(post->path_str(), [&]() {
    const auto url = resolver_.post_url(post->file_path());
    const auto day = utils::parse_date_token(post->path_str(), post->basename());
    Metadata metadata = post->metadata();
    metadata["type"] = "post";
    metadata["url"] = url;
    metadata["date"] = fmt::format("{:04d}-{:02d}-{:02d}", day.year(), day.month(), day.day());
    const auto& body = post->body();
    if (body.empty()) {
      spdlog::warn("empty content: {}", post->path_str());
    }
    writer_->write(UrlResolver::index_file(url), engine_->render(metadata, body));
    spdlog::debug("made post: {} -> {}", post->path_str(), url);
  });
}

inline UnitResult Maker::render_page(const ContentUnitPtr& page) const {
  return guarded(page->path_str(), [&]() {
    Metadata metadata = page->metadata();
    metadata["type"] = "site";
    const auto& body = page->body();
    if (body.empty()) {
      spdlog::warn("empty content: {}", page->path_str());
    }
    const auto relative_path = resolver_.site_url(page->file_path(), page->meta_str("extension"));
    writer_->write(relative_path, engine_->render(metadata, body));
    spdlog::debug("made page: {} -> {}", page->path_str(), relative_path);
  });
}

inline void Maker::render_units() {
  utils::ScopedTimer timer("render");
  std::vector<ContentUnitPtr> units;
  units.reserve(posts_.size() + pages_.size());
  units.insert(units.end(), posts_.begin(), posts_.end());
  units.insert(units.end(), pages_.begin(), pages_.end());
  const auto results = utils::parallel_map(*executor_, units, [this](const ContentUnitPtr& unit) {
    return unit->kind() == ContentKind::POSTS ? render_post(unit) : render_page(unit);
  });
  for (const auto& result : results) {
    if (!result.ok) {
      failures_.emplace_back(result);
    }
  }
}

inline Metadata Maker::listing_metadata(const std::string& title) const {
  Metadata metadata = Metadata::object();
  metadata["title"] = title;
  metadata["description"] = conf_->site_description;
  metadata["type"] = "site";
  return metadata;
}

inline void Maker::write_listing(const std::string& relative_path,
                                 const std::string& title,
                                 const std::string& content) const {
  writer_->write(relative_path, engine_->render(listing_metadata(title), content));
}

inline void Maker::make_tags() const {
  write_listing(TAGS_INDEX_FILE, "Tags", render_tag_index(build_tag_index(posts_, resolver_)));
}

inline void Maker::make_archives() const {
  const auto index = build_archive_index(posts_);
  write_listing(ARCHIVES_INDEX_FILE, "Archives", render_archive_index(index));
  for (const auto& [month_key, count] : index) {
    const auto month = utils::parse_month_token(month_key, month_key);
    const auto title = utils::format_month_title(month);
    const auto month_posts = posts_for_month(posts_, month_key);
    write_listing(UrlResolver::index_file(archive_url(month_key)), title,
                  markup::element("h2", title) + render_snippets(month_posts, resolver_));
  }
}

inline void Maker::make_latest_posts() const {
  const std::vector<ContentUnitPtr> newest_first(posts_.rbegin(), posts_.rend());
  auto pages = build_pages(newest_first, static_cast<size_t>(conf_->posts_per_page));
  if (pages.empty()) {
    pages.emplace_back();
  }
  std::string newest_html;
  for (const auto& page : pages) {
    const auto html = engine_->render(listing_metadata(conf_->site_title),
                                      render_snippets(page.posts, resolver_) + render_pager(page));
    writer_->write(UrlResolver::index_file(latest_posts_url(page.index)), html);
    newest_html = html;
  }
  if (conf_->blog_as_index) {
    writer_->write(SITE_INDEX_FILE, newest_html);
  }
}

inline void Maker::make_rss() const {
  writer_->write(RSS_FEED_FILE, feed::build_rss(*conf_, posts_, resolver_, *executor_));
}

inline void Maker::make_sitemap() const {
  writer_->write(SITEMAP_FILE, feed::build_sitemap(feed::sitemap_locations(conf_->site_url, posts_, pages_, resolver_)));
}

// 聚合任务只读取已加载的文章集合，彼此之间没有依赖
inline void Maker::make_aggregates() {
  utils::ScopedTimer timer("aggregate");
  std::vector<AggregateJob> jobs;
  jobs.push_back({"tags", [this]() { make_tags(); }});
  if (conf_->create_archives) {
    jobs.push_back({"archives", [this]() { make_archives(); }});
  }
  jobs.push_back({"latest-posts", [this]() { make_latest_posts(); }});
  jobs.push_back({"rss-feed", [this]() { make_rss(); }});
  jobs.push_back({"sitemap", [this]() { make_sitemap(); }});
  // RSS 条目在 render 执行器上并行构建，聚合任务使用独立的执行器以免互相等待
  utils::Executor aggregate_executor("aggregate", 16, static_cast<unsigned int>(jobs.size()));
  const auto results = utils::parallel_map(aggregate_executor, jobs,
                                           [this](const AggregateJob& job) { return guarded(job.name, job.run); });
  for (const auto& result : results) {
    if (!result.ok) {
      failures_.emplace_back(result);
    }
  }
}

inline bool Maker::make() {
  utils::ScopedTimer timer("make");
  failures_.clear();
  posts_.clear();
  pages_.clear();
  load();
  prepare();
  render_units();
  make_aggregates();
  if (!failures_.empty()) {
    spdlog::error("{} unit(s) failed:", failures_.size());
    for (const auto& failure : failures_) {
      spdlog::error("  {}: {}", failure.path, failure.error);
    }
    return false;
  }
  spdlog::info("made {} posts and {} pages into {}", posts_.size(), pages_.size(), writer_->out_root().string());
  return true;
}

}  // namespace stele
