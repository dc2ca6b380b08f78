#ifndef _INCLUDE_LINKMINT_URL_SHORTENER_SERVICE_H
#define _INCLUDE_LINKMINT_URL_SHORTENER_SERVICE_H

#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "linkmint/db.h"
#include "linkmint/token_generator.h"

namespace linkmint {
namespace url_shortener {

static constexpr std::size_t max_long_url_length = 1000;

enum class ShortenError {
  InvalidUrl,
  AllocationFailed,
  StoreFailed,
};

enum class ResolveError {
  InvalidToken,
  NotFound,
  StoreFailed,
};

auto shorten_error_name(ShortenError err) noexcept -> std::string_view;
auto resolve_error_name(ResolveError err) noexcept -> std::string_view;

struct ShortenedUrl {
  std::string token;
  std::string long_url;
  // public base URL followed by the token
  std::string short_url;
};

// Checks done before a long URL is given a token: non-empty, not longer
// than `max_long_url_length`, http or https scheme, something after the
// scheme.
auto is_acceptable_long_url(std::string_view long_url) -> bool;

// Creates and resolves short links: one token per `shorten` call, stored in
// the token store.
class UrlShortenerService {
public:
  UrlShortenerService(std::shared_ptr<token::TokenGenerator> generator,
                      std::shared_ptr<db::ShortenedUrlsDatabase> db,
                      std::string public_base_url);

  auto shorten(std::string_view long_url)
      -> std::variant<ShortenedUrl, ShortenError>;

  auto resolve(std::string_view token)
      -> std::variant<std::string, ResolveError>;

private:
  std::shared_ptr<token::TokenGenerator> generator_;
  std::shared_ptr<db::ShortenedUrlsDatabase> db_;
  const std::string public_base_url_;
};

} // namespace url_shortener
} // namespace linkmint

#endif // _INCLUDE_LINKMINT_URL_SHORTENER_SERVICE_H
