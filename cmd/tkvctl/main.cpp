#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/paginate.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using namespace tkv;

static void Usage() {
  std::cout << "Usage:\n"
            << "  tkvctl <config.yaml> set <payload> <id...>\n"
            << "  tkvctl <config.yaml> get <id...>\n"
            << "  tkvctl <config.yaml> exists <id...>\n"
            << "  tkvctl <config.yaml> delete <id...>\n"
            << "  tkvctl <config.yaml> range [--consistent] [--from ns] [--to ns] [--offset n] [--limit n]\n";
}

static std::optional<std::int64_t> ParseInt(const std::string& s) {
  try {
    std::size_t pos   = 0;
    auto        value = std::stoll(s, &pos);
    if (pos != s.size()) return std::nullopt;
    return value;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

static int Range(factory::Application& app, const std::vector<std::string>& args) {
  bool            consistent = false;
  core::TimeRange range;
  std::int64_t    offset = 0;
  std::int64_t    limit  = app.page_size;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto& flag = args[i];
    if (flag == "--consistent") {
      consistent = true;
      continue;
    }

    if (i + 1 >= args.size()) {
      std::cerr << "missing value for " << flag << "\n";
      return 1;
    }
    auto value = ParseInt(args[++i]);
    if (!value) {
      std::cerr << "invalid integer for " << flag << ": " << args[i] << "\n";
      return 1;
    }

    if (flag == "--from") {
      range.from = util::FromUnixNanos(*value);
    } else if (flag == "--to") {
      range.to = util::FromUnixNanos(*value);
    } else if (flag == "--offset") {
      offset = *value;
    } else if (flag == "--limit") {
      limit = *value;
    } else {
      std::cerr << "unknown flag: " << flag << "\n";
      return 1;
    }
  }

  auto fetch  = consistent ? app.kv->ConsistentPageFn() : app.kv->PageFn();
  auto ctx    = util::Context::Background();
  auto cursor = core::Paginate(ctx, std::move(fetch), range, offset, limit);

  while (cursor->Next()) {
    const auto& item = cursor->Current();
    if (!item.ok()) {
      TKV_LOG_ERROR("range failed", {observability::StringField("error", item.error().message)});
      return 1;
    }
    if (item.present()) {
      std::cout << item.View() << "\n";
    } else {
      std::cout << "<missing>\n";
    }
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[1];
  const std::string        cmd         = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto app = factory::Build(config);
    auto ctx = util::Context::Background();

    int rc = 0;

    // ------------------------------------------------------------

    if (cmd == "set") {
      if (args.size() < 2) {
        Usage();
        return 1;
      }
      core::Id id(args.begin() + 1, args.end());
      bool     existed = app.kv->Set(ctx, args[0], util::Now(), id);
      std::cout << (existed ? "updated" : "created") << "\n";
    } else if (cmd == "get") {
      if (args.empty()) {
        Usage();
        return 1;
      }
      auto value = app.kv->Get(ctx, args);
      if (!value) {
        std::cout << "<missing>\n";
        rc = 1;
      } else {
        std::cout << *value << "\n";
      }
    } else if (cmd == "exists") {
      if (args.empty()) {
        Usage();
        return 1;
      }
      bool found = app.kv->Exists(ctx, args);
      std::cout << (found ? "true" : "false") << "\n";
      rc = found ? 0 : 1;
    } else if (cmd == "delete") {
      if (args.empty()) {
        Usage();
        return 1;
      }
      app.kv->Delete(ctx, args);
      std::cout << "deleted\n";
    } else if (cmd == "range") {
      rc = Range(app, args);
    } else {
      Usage();
      rc = 1;
    }

    observability::ShutdownLogging();
    return rc;
  } catch (const util::StoreError& e) {
    TKV_LOG_ERROR("command failed", {observability::StringField("command", cmd),
                                     observability::StringField("code", store::ErrorCodeName(e.code())),
                                     observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
