#ifndef UPNP_SCAN_UTILS_HPP
#define UPNP_SCAN_UTILS_HPP

#include <string>
#include <string_view>
#include <cstdint>

namespace utils
{

struct url
{
    std::string scheme;
    std::string host;   /// without brackets for ipv6 literals
    uint16_t port = 0;
    std::string path;   /// includes the query, always starts with '/'
};

/**
 * Splits an absolute url of the form scheme://host[:port][/path]
 * Throws std::invalid_argument if the url has no scheme or host
 */
url parse_url(std::string_view str);

/**
 * Resolves a reference against an absolute base url
 * Absolute references are returned unchanged
 */
std::string resolve_url(std::string_view base, std::string_view reference);

bool has_scheme(std::string_view str);

std::string to_lower(std::string_view str);

std::string_view trim(std::string_view str);

} // namespace utils

#endif
