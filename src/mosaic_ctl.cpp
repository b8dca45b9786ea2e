#include "manifest/errors.h"
#include "manifest/manifest_diff.h"
#include "manifest/memory_root_manifest.h"
#include "manifest/tree_manifest.h"
#include "utilities/config.hpp"
#include "utilities/content_store.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace mosaic;

static std::vector<std::byte> toBytes(const std::string &s) {
  std::vector<std::byte> data;
  data.reserve(s.size());
  for (char c : s)
    data.push_back(std::byte(c));
  return data;
}

static std::vector<std::byte> readFile(const std::filesystem::path &p) {
  std::ifstream in(p, std::ios::binary);
  if (!in)
    throw std::runtime_error("Cannot read " + p.string());
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  return toBytes(content);
}

static const char *typeName(EntryType type) {
  switch (type) {
  case EntryType::File:
    return "file";
  case EntryType::Executable:
    return "exec";
  case EntryType::Symlink:
    return "link";
  case EntryType::Tree:
    return "tree";
  }
  return "?";
}

static int import_command(const ManifestContext &ctx, const std::string &dir) {
  namespace fs = std::filesystem;
  auto root = MemoryRootManifest::create(ctx, std::nullopt, std::nullopt).get();

  // Edits are issued in batches no wider than the thread budget.
  const size_t batch = std::max<size_t>(1, ctx.fanout->limit());
  std::vector<std::future<void>> pending;
  auto drain = [&pending] {
    for (auto &f : pending)
      f.get();
    pending.clear();
  };
  for (const auto &entry : fs::recursive_directory_iterator(dir)) {
    MPath path(fs::relative(entry.path(), dir).generic_string());
    if (entry.is_symlink()) {
      NodeHash hash = ctx.store->put(toBytes(fs::read_symlink(entry.path()).string()));
      pending.push_back(root.changeEntry(
          path, BlobEntry(path.basename(), hash, EntryType::Symlink)));
    } else if (entry.is_regular_file()) {
      NodeHash hash = ctx.store->put(readFile(entry.path()));
      auto perms = entry.status().permissions();
      bool exec = (perms & fs::perms::owner_exec) != fs::perms::none;
      pending.push_back(root.changeEntry(
          path, BlobEntry(path.basename(), hash,
                          exec ? EntryType::Executable : EntryType::File)));
    }
    if (pending.size() >= batch)
      drain();
  }
  drain();

  BlobEntry saved = root.save().get();
  std::cout << saved.hash().toHex() << std::endl;
  return 0;
}

static int ls_command(const ManifestContext &ctx, const std::string &hex) {
  NodeHash hash = NodeHash::fromHex(hex);
  auto manifest = TreeManifest::load(*ctx.store, hash);
  if (!manifest)
    throw ManifestMissing(hash);
  for (const auto &e : manifest->list()) {
    std::cout << e.hash.toHex() << '\t' << typeName(e.type) << '\t'
              << e.name.str() << std::endl;
  }
  return 0;
}

static int rm_command(const ManifestContext &ctx, const std::string &hex,
                      const std::string &path) {
  auto root =
      MemoryRootManifest::create(ctx, NodeHash::fromHex(hex), std::nullopt)
          .get();
  root.changeEntry(MPath(path), std::nullopt).get();
  std::cout << root.save().get().hash().toHex() << std::endl;
  return 0;
}

static int merge_command(const ManifestContext &ctx, const std::string &p1,
                         const std::string &p2) {
  auto merged = MemoryRootManifest::create(ctx, NodeHash::fromHex(p1),
                                           NodeHash::fromHex(p2))
                    .get();
  auto conflicts = merged.conflicts();
  if (!conflicts.empty()) {
    std::cout << "Unresolved conflicts:" << std::endl;
    for (const auto &p : conflicts)
      std::cout << "  " << p.toString() << std::endl;
    return 1;
  }
  std::cout << merged.save().get().hash().toHex() << std::endl;
  return 0;
}

static int diff_command(const ManifestContext &ctx, const std::string &to,
                        const std::string &from) {
  auto changes = diffManifests(*ctx.store, NodeHash::fromHex(to),
                               NodeHash::fromHex(from));
  for (const auto &c : changes) {
    std::cout << entryStatusName(c.status) << ' '
              << (c.path ? c.path->toString() : std::string()) << std::endl;
  }
  return 0;
}

static void usage() {
  std::cout << "Usage: mosaic_ctl import <dir>\n"
            << "       mosaic_ctl ls <tree-hash>\n"
            << "       mosaic_ctl rm <root-hash> <path>\n"
            << "       mosaic_ctl merge <p1-hash> <p2-hash>\n"
            << "       mosaic_ctl diff <to-hash> <from-hash>\n";
}

int main(int argc, char **argv) {
  if (argc < 3) {
    usage();
    return 1;
  }
  std::string cmd = argv[1];

  MosaicConfig config;
  try {
    config = loadConfig();
    std::filesystem::create_directories(
        std::filesystem::path(config.logFile).parent_path());
    Logger::init(config.logFile, config.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: initialization failed: " << e.what() << std::endl;
    return 1;
  }

  ManifestContext ctx;
  ctx.logger = &Logger::getInstance();
  ctx.metrics = &MetricsRegistry::instance();
  ctx.parallel = config.parallelFanout;
  ctx.fanout = std::make_shared<FanoutBudget>(config.maxFanoutThreads);
  registerManifestMetrics(MetricsRegistry::instance());
  Logger::getInstance().log(
      LogLevel::DEBUG,
      "Using " + config.storeBackend + " store (" +
          utils::hashAlgorithmName(config.hashAlgorithm) + ", up to " +
          std::to_string(config.maxFanoutThreads) + " fan-out threads)");

  int rc = 1;
  try {
    ctx.store = makeContentStore(config);
    if (cmd == "import") {
      rc = import_command(ctx, argv[2]);
    } else if (cmd == "ls") {
      rc = ls_command(ctx, argv[2]);
    } else if (cmd == "rm" && argc >= 4) {
      rc = rm_command(ctx, argv[2], argv[3]);
    } else if (cmd == "merge" && argc >= 4) {
      rc = merge_command(ctx, argv[2], argv[3]);
    } else if (cmd == "diff" && argc >= 4) {
      rc = diff_command(ctx, argv[2], argv[3]);
    } else {
      usage();
    }
  } catch (const ManifestException &e) {
    std::cerr << errorKindName(e.kind()) << ": " << e.what() << std::endl;
    rc = 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    rc = 2;
  }

  const char *showMetrics = std::getenv("MOSAIC_METRICS");
  if (showMetrics && std::string(showMetrics) == "1")
    std::cerr << MetricsRegistry::instance().toPrometheus();
  return rc;
}
