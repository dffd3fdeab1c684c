#ifndef UPNP_SCAN_SSDP_DISCOVERY_HPP
#define UPNP_SCAN_SSDP_DISCOVERY_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "net_interfaces.hpp"

namespace discovery
{

#define DISCOVERY_IP_V4 "239.255.255.250"
#define DISCOVERY_IP_V6_LINK_LOCAL "FF02::C"
#define DISCOVERY_IP_V6_SITE_LOCAL "FF05::C"
#define DISCOVERY_PORT 1900
#define DISCOVERY_MX 3
#define DISCOVERY_SEND_COUNT 3
#define DISCOVERY_TIME 3000

enum class address_class
{
    ipv4,
    ipv6_link_local,
    ipv6_site_local,
    unknown
};

address_class classify(const utils::local_address& addr);

/**
 * Multicast group address of an address class or nullptr for unknown
 */
const char* multicast_group(address_class cls);

struct search_config
{
    std::chrono::milliseconds timeout {DISCOVERY_TIME};
    size_t send_count = DISCOVERY_SEND_COUNT;
    size_t buffer_size = 4096;
};

/**
 * M-SEARCH request for the multicast group of cls
 */
std::string build_search_request(address_class cls, std::string_view search_target);

/**
 * Sends the search request from one local address and collects the raw
 * responses until the receive window elapses. Transport failures end the
 * search early with whatever was received so far.
 */
std::vector<std::string> search_address(const utils::local_address& addr, const std::string& search_target,
    const search_config& config = {});

/**
 * Runs search_address concurrently for every address of the provider and
 * merges the responses
 */
std::vector<std::string> search_all(const std::string& search_target, const utils::interface_provider& interfaces,
    const search_config& config = {});

using header_map = std::map<std::string, std::string>;

struct ssdp_res
{
    std::string usn;
    std::string location;
    std::string st;
    std::string cache_control;
    std::string server;

    header_map headers; /// every header of the response, names in lower case

    std::optional<int> max_age() const;
};

/**
 * Splits a response into lower case header names and trimmed values
 * Lines without a colon are skipped, later duplicates replace earlier ones
 */
header_map parse_headers(std::string_view response);

/**
 * Returns std::nullopt if one of the headers backing an ssdp_res field is missing
 */
std::optional<ssdp_res> parse_response(std::string_view response);

/**
 * Parses all responses and keeps the first record for every usn
 */
std::vector<ssdp_res> parse_responses(const std::vector<std::string>& responses);

std::vector<ssdp_res> search_devices(const std::string& device_type);

std::vector<ssdp_res> search_devices(const std::string& device_type, const utils::interface_provider& interfaces,
    const search_config& config = {});

} // namespace discovery

#endif
