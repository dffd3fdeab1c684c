#include "upnp_discovery.hpp"
#include "logger.hpp"

#include <rapidxml/rapidxml.hpp>

#include <future>
#include <iterator>
#include <stdexcept>

namespace upnp
{

std::optional<std::vector<upnp_device>> fetch_description(const discovery::ssdp_res& notification, const http::client& client)
{
    try {
        return parse_description(client.get(notification.location), notification.location);
    } catch(const http::http_error& e) {
        logger::info("Skipping {}: {}", notification.usn, e.what());
    } catch(const rapidxml::parse_error& e) {
        logger::info("Skipping {}: malformed description ({})", notification.usn, e.what());
    } catch(const std::invalid_argument& e) {
        // Malformed location or http message
        logger::info("Skipping {}: {}", notification.usn, e.what());
    } catch(const std::runtime_error& e) {
        // Connection failures, timeouts and descriptions without a device
        logger::info("Skipping {}: {}", notification.usn, e.what());
    }
    return std::nullopt;
}

std::vector<upnp_device> fetch_devices(const std::vector<discovery::ssdp_res>& notifications, const http::client& client)
{
    std::vector<std::future<std::optional<std::vector<upnp_device>>>> fetches;
    fetches.reserve(notifications.size());
    for(const auto& notification : notifications)
    {
        fetches.push_back(std::async(std::launch::async, [&notification, &client]() {
            return fetch_description(notification, client);
        }));
    }

    std::vector<upnp_device> devices;
    for(auto& fetch : fetches)
    {
        std::optional<std::vector<upnp_device>> result = fetch.get();
        if(result)
            std::move(result->begin(), result->end(), std::back_inserter(devices));
    }
    return devices;
}

std::vector<upnp_device> search_upnp_devices(const std::string& device_type, int device_version,
    const utils::interface_provider& interfaces, const http::client& client,
    const discovery::search_config& config)
{
    std::vector<discovery::ssdp_res> notifications =
        discovery::search_devices(device_urn(device_type, device_version), interfaces, config);
    logger::debug("{} notification(s) for {}", notifications.size(), device_type);

    return fetch_devices(notifications, client);
}

std::vector<upnp_device> search_upnp_devices(const std::string& device_type, int device_version)
{
    return search_upnp_devices(device_type, device_version, utils::system_interfaces {}, http::tcp_client {});
}

} // namespace upnp
