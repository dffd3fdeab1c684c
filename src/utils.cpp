#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace utils
{

static uint16_t default_port(std::string_view scheme)
{
    if(scheme == "https")
        return 443;
    return 80;
}

bool has_scheme(std::string_view str)
{
    size_t sep = str.find("://");
    if(sep == std::string_view::npos || sep == 0)
        return false;

    return std::all_of(str.begin(), str.begin() + sep, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    });
}

url parse_url(std::string_view str)
{
    str = trim(str);
    if(!has_scheme(str))
        throw std::invalid_argument {"url without scheme"};

    url parsed;
    size_t sep = str.find("://");
    parsed.scheme = to_lower(str.substr(0, sep));
    str.remove_prefix(sep + 3);

    size_t path_start = str.find_first_of("/?");
    std::string_view authority = str.substr(0, path_start);
    if(path_start == std::string_view::npos)
        parsed.path = "/";
    else if(str[path_start] == '?')
        parsed.path = "/" + std::string {str.substr(path_start)};
    else
        parsed.path = std::string {str.substr(path_start)};

    // Drop user info
    if(size_t at = authority.rfind('@'); at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    std::string_view port_view;
    if(!authority.empty() && authority.front() == '[')
    {
        size_t close = authority.find(']');
        if(close == std::string_view::npos)
            throw std::invalid_argument {"unterminated ipv6 literal in url"};

        parsed.host = std::string {authority.substr(1, close - 1)};
        if(close + 1 < authority.size())
        {
            if(authority[close + 1] != ':')
                throw std::invalid_argument {"invalid url authority"};
            port_view = authority.substr(close + 2);
        }
    }
    else
    {
        size_t colon = authority.find(':');
        parsed.host = std::string {authority.substr(0, colon)};
        if(colon != std::string_view::npos)
            port_view = authority.substr(colon + 1);
    }

    if(parsed.host.empty())
        throw std::invalid_argument {"url without host"};

    if(port_view.empty())
    {
        parsed.port = default_port(parsed.scheme);
    }
    else
    {
        unsigned int port = 0;
        auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port);
        if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size() || port == 0 || port > 65535)
            throw std::invalid_argument {"invalid port in url"};
        parsed.port = static_cast<uint16_t>(port);
    }

    return parsed;
}

// Drops the last segment of output together with its leading '/'
static void pop_segment(std::string& output)
{
    size_t slash = output.rfind('/');
    output.erase((slash == std::string::npos) ? 0 : slash);
}

// RFC 3986 section 5.2.4
static std::string remove_dot_segments(std::string_view input)
{
    std::string output;
    while(!input.empty())
    {
        if(input.substr(0, 3) == "../")
            input.remove_prefix(3);
        else if(input.substr(0, 2) == "./")
            input.remove_prefix(2);
        else if(input.substr(0, 3) == "/./")
            input.remove_prefix(2);
        else if(input == "/.")
            input = "/";
        else if(input.substr(0, 4) == "/../")
        {
            input.remove_prefix(3);
            pop_segment(output);
        }
        else if(input == "/..")
        {
            input = "/";
            pop_segment(output);
        }
        else if(input == "." || input == "..")
            input = {};
        else
        {
            size_t next = input.find('/', 1);
            output.append(input.substr(0, next));
            input.remove_prefix((next == std::string_view::npos) ? input.size() : next);
        }
    }
    return output;
}

// Normalizes the path of a reference and keeps its query untouched
static std::string normalize_reference(std::string_view reference)
{
    size_t query = reference.find_first_of("?#");
    std::string normalized = remove_dot_segments(reference.substr(0, query));
    if(query != std::string_view::npos)
        normalized.append(reference.substr(query));
    return normalized;
}

std::string resolve_url(std::string_view base, std::string_view reference)
{
    reference = trim(reference);
    if(has_scheme(reference))
        return std::string {reference};

    base = trim(base);
    if(reference.empty())
        return std::string {base};

    size_t scheme_end = base.find("://");
    if(scheme_end == std::string_view::npos)
        return std::string {reference};

    // Network-path reference keeps only the scheme of the base
    if(reference.substr(0, 2) == "//")
        return std::string {base.substr(0, scheme_end + 1)} + std::string {reference};

    size_t path_start = base.find('/', scheme_end + 3);
    std::string_view origin = base.substr(0, path_start);
    std::string_view base_path = (path_start == std::string_view::npos) ? std::string_view {"/"} : base.substr(path_start);

    // Query and fragment of the base never take part in resolution
    base_path = base_path.substr(0, base_path.find_first_of("?#"));

    if(reference.front() == '/')
        return std::string {origin} + normalize_reference(reference);

    if(reference.front() == '?')
        return std::string {origin} + std::string {base_path} + std::string {reference};

    // Merge with the directory of the base path, including its trailing slash
    std::string merged {base_path.substr(0, base_path.rfind('/') + 1)};
    merged.append(reference);
    return std::string {origin} + normalize_reference(merged);
}

std::string to_lower(std::string_view str)
{
    std::string lower {str};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::string_view trim(std::string_view str)
{
    const char* whitespace = " \t\r\n";
    size_t first = str.find_first_not_of(whitespace);
    if(first == std::string_view::npos)
        return {};

    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

} // namespace utils
