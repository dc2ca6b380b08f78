#include "linkmint/url_shortener_service.h"

#include <glog/logging.h>

#include "linkmint/errors.h"
#include "linkmint/identifier_encoder.h"

namespace linkmint {
namespace url_shortener {

using namespace std::literals;

auto shorten_error_name(ShortenError err) noexcept -> std::string_view {
  switch (err) {
  case ShortenError::InvalidUrl:
    return "invalid long URL";
  case ShortenError::AllocationFailed:
    return "could not allocate an identifier";
  case ShortenError::StoreFailed:
    return "could not store the short link";
  }
  return "unknown shorten error";
}

auto resolve_error_name(ResolveError err) noexcept -> std::string_view {
  switch (err) {
  case ResolveError::InvalidToken:
    return "malformed token";
  case ResolveError::NotFound:
    return "URL not found";
  case ResolveError::StoreFailed:
    return "token store error";
  }
  return "unknown resolve error";
}

auto is_acceptable_long_url(std::string_view long_url) -> bool {
  if (long_url.empty() || long_url.length() > max_long_url_length) {
    return false;
  }
  std::string_view rest;
  if (long_url.starts_with("https://"sv)) {
    rest = long_url.substr("https://"sv.size());
  } else if (long_url.starts_with("http://"sv)) {
    rest = long_url.substr("http://"sv.size());
  } else {
    return false;
  }
  if (rest.empty()) {
    return false;
  }
  for (char c : long_url) {
    // no whitespace or control characters in a redirect target
    if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f) {
      return false;
    }
  }
  return true;
}

UrlShortenerService::UrlShortenerService(
    std::shared_ptr<token::TokenGenerator> generator,
    std::shared_ptr<db::ShortenedUrlsDatabase> db, std::string public_base_url)
    : generator_(std::move(generator)), db_(std::move(db)),
      public_base_url_(std::move(public_base_url)) {
  CHECK(generator_) << "UrlShortenerService needs a token generator";
  CHECK(db_) << "UrlShortenerService needs a token store";
}

auto UrlShortenerService::shorten(std::string_view long_url)
    -> std::variant<ShortenedUrl, ShortenError> {
  if (!is_acceptable_long_url(long_url)) {
    DLOG(INFO) << "rejected long_url=\"" << long_url << "\"";
    return ShortenError::InvalidUrl;
  }
  std::string token;
  try {
    token = generator_->next();
  } catch (const AllocationError &e) {
    LOG(ERROR) << "token generation failed for long_url=\"" << long_url
               << "\": " << e.what();
    return ShortenError::AllocationFailed;
  }
  auto err = db_->put(token, long_url);
  if (auto store_err = std::get_if<db::TokenStoreError>(&err)) {
    if (*store_err == db::TokenStoreError::AlreadyExists) {
      // the allocator handed out an identifier that was issued before
      LOG(ERROR) << "token \"" << token << "\" was already issued, refusing "
                 << "to remap it to long_url=\"" << long_url << "\"";
      return ShortenError::AllocationFailed;
    }
    LOG(ERROR) << "rocksdb errored during insert of: long_url=\"" << long_url
               << "\", token=\"" << token
               << "\": " << db::token_store_error_name(*store_err);
    return ShortenError::StoreFailed;
  }
  LOG(INFO) << "created token " << token << " for " << long_url;
  ShortenedUrl out;
  out.short_url = public_base_url_ + token;
  out.token = std::move(token);
  out.long_url = std::string{long_url};
  return out;
}

auto UrlShortenerService::resolve(std::string_view token)
    -> std::variant<std::string, ResolveError> {
  // Only the symbols are checked here. Tokens issued under an earlier, smaller
  // id offset are still in the store.
  auto decoded = ::linkmint::token::decode(token, generator_->alphabet());
  if (decoded.hasError() && (decoded.error() == DecodeError::Empty ||
                             decoded.error() == DecodeError::UnknownSymbol)) {
    DLOG(INFO) << "token \"" << token
               << "\" rejected: " << decode_error_name(decoded.error());
    return ResolveError::InvalidToken;
  }
  auto got = db_->get(token);
  if (auto err = std::get_if<db::TokenStoreError>(&got)) {
    if (*err == db::TokenStoreError::NotFound) {
      return ResolveError::NotFound;
    }
    LOG(ERROR) << "token store lookup of \"" << token
               << "\" failed: " << db::token_store_error_name(*err);
    return ResolveError::StoreFailed;
  }
  auto long_url = std::get<std::string>(std::move(got));
  VLOG(1) << "Redirecting '" << token << "' -> " << long_url;
  return long_url;
}

} // namespace url_shortener
} // namespace linkmint
