#include <filesystem>
#include <folly/Conv.h>
#include <folly/Range.h>
#include <folly/init/Init.h>
#include <folly/portability/GFlags.h>
#include <glog/logging.h>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "linkmint/alphabet.h"
#include "linkmint/alphabet_permuter.h"
#include "linkmint/app_config.h"
#include "linkmint/db.h"
#include "linkmint/errors.h"
#include "linkmint/identifier_allocator.h"
#include "linkmint/identifier_encoder.h"
#include "linkmint/token_generator.h"
#include "linkmint/url_shortener_service.h"

DEFINE_string(config_file, "",
              "Path to YAML configuration file. When empty, configuration "
              "is read from LINKMINT__* environment variables.");

namespace {

using ::linkmint::app_config::ReadOnlyAppConfig;

constexpr const char *usage =
    "usage: linkmint [flags] <command> [args...]\n"
    "commands:\n"
    "  shorten <long_url>...   allocate a token for each URL and store it\n"
    "  resolve <token>...      print the long URL stored for each token\n"
    "  encode <identifier>     print the token for a raw allocator identifier\n"
    "                          (id_offset is added before encoding)\n"
    "  decode <token>          print the raw allocator identifier of a token\n"
    "                          (id_offset is removed after decoding)\n"
    "  alphabet                print the permuted alphabet\n";

auto load_config() -> ReadOnlyAppConfig::Ptr {
  if (!FLAGS_config_file.empty()) {
    const auto config_file_path = std::filesystem::path{FLAGS_config_file};
    CHECK(std::filesystem::exists(config_file_path))
        << "Config file at \"" << FLAGS_config_file << "\" does not exist";
    return ReadOnlyAppConfig::new_from_yaml(config_file_path);
  }
  return ReadOnlyAppConfig::new_from_env();
}

auto make_allocator(const ReadOnlyAppConfig &config,
                    std::shared_ptr<::linkmint::db::ShortenedUrlsDatabase> db)
    -> std::shared_ptr<::linkmint::token::IdentifierAllocator> {
  switch (config.allocator) {
  case ::linkmint::app_config::AllocatorKind::Memory:
    return std::make_shared<::linkmint::token::AtomicIdentifierAllocator>(
        config.first_identifier);
  case ::linkmint::app_config::AllocatorKind::RocksDb:
    break;
  }
  return std::make_shared<::linkmint::token::RocksDbIdentifierAllocator>(
      std::move(db), config.first_identifier);
}

auto run_shorten(::linkmint::url_shortener::UrlShortenerService &svc,
                 const std::vector<std::string> &urls) -> int {
  int rc = 0;
  for (const auto &url : urls) {
    auto got = svc.shorten(url);
    if (auto err = std::get_if<::linkmint::url_shortener::ShortenError>(&got)) {
      std::cerr << url << ": "
                << ::linkmint::url_shortener::shorten_error_name(*err) << "\n";
      rc = 1;
      continue;
    }
    const auto &shortened =
        std::get<::linkmint::url_shortener::ShortenedUrl>(got);
    std::cout << shortened.token << "\t" << shortened.short_url << "\n";
  }
  return rc;
}

auto run_resolve(::linkmint::url_shortener::UrlShortenerService &svc,
                 const std::vector<std::string> &tokens) -> int {
  int rc = 0;
  for (const auto &token : tokens) {
    auto got = svc.resolve(token);
    if (auto err = std::get_if<::linkmint::url_shortener::ResolveError>(&got)) {
      std::cerr << token << ": "
                << ::linkmint::url_shortener::resolve_error_name(*err) << "\n";
      rc = 1;
      continue;
    }
    std::cout << std::get<std::string>(got) << "\n";
  }
  return rc;
}

auto run(int argc, char *argv[]) -> int {
  if (argc < 2) {
    std::cerr << usage;
    return 2;
  }
  const std::string command{argv[1]};
  const std::vector<std::string> args(argv + 2, argv + argc);

  auto config = load_config();
  const auto canonical = ::linkmint::token::Alphabet::create(config->alphabet);

  // derived once for the life of the process
  ::linkmint::token::PermutedAlphabetCache permuted_alphabets;
  const auto &permuted = permuted_alphabets.get(config->secret_key, canonical);

  if (command == "alphabet") {
    std::cout << permuted.symbols() << "\n";
    return 0;
  }
  if (command == "encode" && args.size() == 1) {
    auto id = folly::tryTo<uint64_t>(folly::StringPiece{args[0]});
    if (!id) {
      std::cerr << "not a non-negative 64-bit integer: " << args[0] << "\n";
      return 2;
    }
    std::cout << ::linkmint::token::encode(
                     ::linkmint::token::apply_offset(*id, config->id_offset),
                     permuted)
              << "\n";
    return 0;
  }
  if (command == "decode" && args.size() == 1) {
    auto value = ::linkmint::token::decode(args[0], permuted);
    auto id = value.hasError()
                  ? value
                  : ::linkmint::token::remove_offset(value.value(),
                                                     config->id_offset);
    if (id.hasError()) {
      std::cerr << args[0] << ": "
                << ::linkmint::decode_error_name(id.error()) << "\n";
      return 1;
    }
    std::cout << id.value() << "\n";
    return 0;
  }
  if ((command != "shorten" && command != "resolve") || args.empty()) {
    std::cerr << usage;
    return 2;
  }

  std::shared_ptr<::linkmint::db::ShortenedUrlsDatabase> db =
      ::linkmint::db::ShortenedUrlsDatabase::open(config->urls_db_path);

  auto generator = std::make_shared<::linkmint::token::TokenGenerator>(
      make_allocator(*config, db), permuted,
      ::linkmint::token::TokenGeneratorOptions{config->id_offset,
                                               config->min_token_length});
  ::linkmint::url_shortener::UrlShortenerService svc{generator, db,
                                                     config->public_base_url};

  if (command == "shorten") {
    return run_shorten(svc, args);
  }
  return run_resolve(svc, args);
}

} // namespace

int main(int argc, char *argv[]) {
  folly::Init _folly_init{&argc, &argv, true};

  try {
    return run(argc, argv);
  } catch (const ::linkmint::ConfigurationError &e) {
    LOG(ERROR) << "Invalid configuration: " << e.what();
    return 1;
  } catch (const ::linkmint::AllocationError &e) {
    LOG(ERROR) << "Identifier allocation failed: " << e.what();
    return 1;
  } catch (const std::runtime_error &e) {
    LOG(ERROR) << "linkmint failed: " << e.what();
    return 1;
  }
}
