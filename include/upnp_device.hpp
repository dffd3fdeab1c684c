#ifndef UPNP_SCAN_UPNP_DEVICE_HPP
#define UPNP_SCAN_UPNP_DEVICE_HPP

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace upnp
{

class description_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct upnp_icon
{
    std::string mime_type;
    int width = 0;
    int height = 0;
    int depth = 0;
    std::string url;
};

struct upnp_service
{
    std::string type;           /// e.g. urn:schemas-upnp-org:service:AVTransport:1
    std::string id;             /// e.g. urn:upnp-org:serviceId:AVTransport
    std::string control_url;
    std::string scpd_url;
    std::string event_sub_url;

    // The short id is the last part of the serviceId, e.g. AVTransport
    std::string_view short_id() const;
};

struct upnp_device
{
    std::string device_type;
    std::string friendly_name;
    std::string manufacturer;
    std::string manufacturer_url;
    std::string model_description;
    std::string model_name;
    std::string model_number;
    std::string model_url;
    std::string serial_number;
    std::string udn;
    std::string upc;
    std::string presentation_url;

    // Absolute url the relative urls of this device are resolved against
    std::string url_base;

    std::vector<upnp_icon> icons;
    std::vector<upnp_service> services;
    std::vector<upnp_device> devices;   /// embedded devices

    bool service_available(std::string_view service_id) const;

    std::optional<std::reference_wrapper<const upnp_service>> get_service_information(std::string_view service_id) const;

    std::string absolute_url(std::string_view relative) const;

    /**
     * Depth first search of this device and its embedded devices
     */
    const upnp_device* find_device(std::string_view type) const;
};

/**
 * Parses a device description document.
 *
 * Every device element below the root becomes one device tree. URLBase of the
 * document, or location if the document has none, is set as url_base on every
 * node of the trees.
 * Throws rapidxml::parse_error for malformed xml and description_error if the
 * document has no root element or no device.
 */
std::vector<upnp_device> parse_description(std::string xml, const std::string& location);

std::string device_urn(std::string_view device_type, int device_version = 1);

} // namespace upnp

#endif
