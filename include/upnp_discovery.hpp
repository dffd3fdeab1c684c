#ifndef UPNP_SCAN_UPNP_DISCOVERY_HPP
#define UPNP_SCAN_UPNP_DISCOVERY_HPP

#include <optional>
#include <string>
#include <vector>

#include "http/client.hpp"
#include "ssdp_discovery.hpp"
#include "upnp_device.hpp"

namespace upnp
{

/**
 * Fetches and parses the description behind the location of one notification.
 * std::nullopt means the notification yields no device: the location is
 * malformed or unreachable, the server answered with an error status or the
 * document is not a valid description. Any other exception propagates.
 */
std::optional<std::vector<upnp_device>> fetch_description(const discovery::ssdp_res& notification, const http::client& client);

/**
 * Fetches the descriptions of all notifications concurrently. Notifications
 * without a usable description are left out.
 */
std::vector<upnp_device> fetch_devices(const std::vector<discovery::ssdp_res>& notifications, const http::client& client);

std::vector<upnp_device> search_upnp_devices(const std::string& device_type, int device_version = 1);

std::vector<upnp_device> search_upnp_devices(const std::string& device_type, int device_version,
    const utils::interface_provider& interfaces, const http::client& client,
    const discovery::search_config& config = {});

} // namespace upnp

#endif
