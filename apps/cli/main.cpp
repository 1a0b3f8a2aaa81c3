#include "herd_cache/client.hpp"
#include "herd_cache/memory_store.hpp"
#include "herd_cache/redis_store.hpp"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

void usage() {
  std::cerr << "usage: herd_cache_cli [--host H] [--port P] [--prefix S] "
               "[--config FILE] [--strong] [--memory]\n"
               "commands:\n"
               "  fetch <key> <ttl_ms> <value|->   read through, loading value "
               "on a miss ('-' loads an absence)\n"
               "  fail <key> <ttl_ms>              read through with a failing "
               "loader\n"
               "  tag <key>                        mark key stale\n"
               "  info                             client counters\n"
               "  quit\n";
}

std::vector<std::string> split(const std::string &line) {
  std::istringstream in(line);
  std::vector<std::string> out;
  std::string tok;
  while (in >> tok)
    out.push_back(tok);
  return out;
}

bool parse_ms(const std::string &s, std::chrono::milliseconds &out) {
  try {
    std::size_t idx = 0;
    const auto v = std::stoll(s, &idx);
    if (idx != s.size() || v <= 0)
      return false;
    out = std::chrono::milliseconds(v);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

void print_result(const std::optional<herd_cache::Bytes> &v) {
  if (!v)
    std::cout << "(absent)\n";
  else
    std::cout << std::string(v->begin(), v->end()) << "\n";
}

void print_error(const herd_cache::Error &e) {
  std::cout << "-ERR " << herd_cache::error_code_name(e.code) << ": "
            << e.message << "\n";
}

} // namespace

int main(int argc, char **argv) {
  herd_cache::RedisStoreConfig redis_cfg;
  herd_cache::Options opts;
  bool use_memory = false;
  bool strong = false;
  std::string config_path;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--host" && i + 1 < argc)
      redis_cfg.host = argv[++i];
    else if (a == "--port" && i + 1 < argc)
      redis_cfg.port = std::stoi(argv[++i]);
    else if (a == "--prefix" && i + 1 < argc)
      redis_cfg.key_prefix = argv[++i];
    else if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--strong")
      strong = true;
    else if (a == "--memory")
      use_memory = true;
    else {
      usage();
      return 2;
    }
  }

  if (!config_path.empty()) {
    std::string err;
    if (!herd_cache::load_options(config_path, &opts, &err)) {
      std::cerr << "config " << config_path << ": " << err << "\n";
      return 1;
    }
  }
  if (strong)
    opts.strong_consistency = true;

  std::shared_ptr<herd_cache::IStore> store;
  if (use_memory) {
    store = std::make_shared<herd_cache::MemoryStore>();
  } else {
    auto redis = std::make_shared<herd_cache::RedisStore>(redis_cfg);
    std::string err;
    if (!redis->ping(&err)) {
      std::cerr << "connect " << redis_cfg.host << ":" << redis_cfg.port
                << " failed: " << err << "\n";
      return 1;
    }
    store = redis;
  }

  herd_cache::Client client(store, opts);
  std::string line;
  while (std::getline(std::cin, line)) {
    const auto args = split(line);
    if (args.empty())
      continue;
    const auto &op = args[0];
    if (op == "quit")
      break;

    if ((op == "fetch" && args.size() == 4) ||
        (op == "fail" && args.size() == 3)) {
      std::chrono::milliseconds ttl{0};
      if (!parse_ms(args[2], ttl)) {
        std::cout << "-ERR invalid ttl\n";
        continue;
      }
      herd_cache::Loader loader;
      if (op == "fail") {
        loader = [](std::optional<herd_cache::Bytes> *, std::string *err) {
          *err = "loader failure requested";
          return false;
        };
      } else {
        const std::string value = args[3];
        loader = [value](std::optional<herd_cache::Bytes> *out,
                         std::string *) {
          if (value == "-")
            *out = std::nullopt;
          else
            *out = herd_cache::Bytes(value.begin(), value.end());
          return true;
        };
      }
      std::optional<herd_cache::Bytes> v;
      herd_cache::Error err;
      if (client.fetch(args[1], ttl, loader, &v, &err))
        print_result(v);
      else
        print_error(err);
    } else if (op == "tag" && args.size() == 2) {
      herd_cache::Error err;
      if (client.tag_as_deleted(args[1], &err))
        std::cout << "OK\n";
      else
        print_error(err);
    } else if (op == "info") {
      std::cout << client.info();
    } else {
      usage();
    }
  }
  client.wait_for_refreshes();
  return 0;
}
