#include "upnp_device.hpp"
#include "utils.hpp"

#include <rapidxml/rapidxml.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>

using namespace rapidxml;

namespace upnp
{

std::string_view upnp_service::short_id() const
{
    std::string_view service_view {id};
    size_t service_offset = service_view.find_last_of(':');
    return (service_offset == std::string_view::npos) ? service_view : service_view.substr(service_offset + 1);
}

bool upnp_device::service_available(std::string_view service_id) const
{
    return get_service_information(service_id).has_value();
}

std::optional<std::reference_wrapper<const upnp_service>> upnp_device::get_service_information(std::string_view service_id) const
{
    // Devices typically have around 3 to 4 services so a linear search is fine
    auto it = std::find_if(services.begin(), services.end(), [&s_id = service_id](const upnp_service& service) {
        return service.id == s_id || service.short_id() == s_id;
    });

    if(it != services.end())
        return *it;
    else
        return std::nullopt;
}

std::string upnp_device::absolute_url(std::string_view relative) const
{
    return utils::resolve_url(url_base, relative);
}

const upnp_device* upnp_device::find_device(std::string_view type) const
{
    if(device_type == type)
        return this;

    for(const auto& embedded : devices)
    {
        if(const upnp_device* found = embedded.find_device(type))
            return found;
    }
    return nullptr;
}

static std::string child_value(const xml_node<char>* node, const char* name)
{
    const xml_node<char>* child = node->first_node(name);
    if(child == nullptr)
        return {};
    return std::string {utils::trim(std::string_view {child->value(), child->value_size()})};
}

static int child_int(const xml_node<char>* node, const char* name)
{
    const std::string value = child_value(node, name);
    int parsed = 0;
    auto res = std::from_chars(value.data(), value.data() + value.size(), parsed);
    return (res.ec == std::errc {}) ? parsed : 0;
}

static upnp_icon parse_icon(const xml_node<char>* node)
{
    upnp_icon icon;
    icon.mime_type = child_value(node, "mimetype");
    icon.width = child_int(node, "width");
    icon.height = child_int(node, "height");
    icon.depth = child_int(node, "depth");
    icon.url = child_value(node, "url");
    return icon;
}

static upnp_service parse_service(const xml_node<char>* node)
{
    upnp_service service;
    service.type = child_value(node, "serviceType");
    service.id = child_value(node, "serviceId");
    service.scpd_url = child_value(node, "SCPDURL");
    service.control_url = child_value(node, "controlURL");
    service.event_sub_url = child_value(node, "eventSubURL");
    return service;
}

static upnp_device parse_device(const xml_node<char>* node)
{
    upnp_device device;
    device.device_type = child_value(node, "deviceType");
    device.friendly_name = child_value(node, "friendlyName");
    device.manufacturer = child_value(node, "manufacturer");
    device.manufacturer_url = child_value(node, "manufacturerURL");
    device.model_description = child_value(node, "modelDescription");
    device.model_name = child_value(node, "modelName");
    device.model_number = child_value(node, "modelNumber");
    device.model_url = child_value(node, "modelURL");
    device.serial_number = child_value(node, "serialNumber");
    device.udn = child_value(node, "UDN");
    device.upc = child_value(node, "UPC");
    device.presentation_url = child_value(node, "presentationURL");

    if(const xml_node<char>* icon_root = node->first_node("iconList"))
    {
        for(const xml_node<char>* icon_node = icon_root->first_node("icon"); icon_node; icon_node = icon_node->next_sibling("icon"))
            device.icons.push_back(parse_icon(icon_node));
    }

    if(const xml_node<char>* service_root = node->first_node("serviceList"))
    {
        for(const xml_node<char>* service_node = service_root->first_node("service"); service_node; service_node = service_node->next_sibling("service"))
            device.services.push_back(parse_service(service_node));
    }

    if(const xml_node<char>* device_root = node->first_node("deviceList"))
    {
        for(const xml_node<char>* device_node = device_root->first_node("device"); device_node; device_node = device_node->next_sibling("device"))
            device.devices.push_back(parse_device(device_node));
    }

    return device;
}

static void apply_url_base(upnp_device& device, const std::string& url_base)
{
    device.url_base = url_base;
    for(auto& embedded : device.devices)
        apply_url_base(embedded, url_base);
}

std::vector<upnp_device> parse_description(std::string xml, const std::string& location)
{
    // rapidxml parses in place, xml owns the terminated buffer
    xml_document<char> doc;
    doc.parse<0>(xml.data());

    const xml_node<char>* root = doc.first_node();
    if(root == nullptr)
        throw description_error {"description has no root element"};

    std::string url_base = child_value(root, "URLBase");
    if(url_base.empty())
        url_base = location;

    std::vector<upnp_device> devices;
    for(const xml_node<char>* device_node = root->first_node("device"); device_node; device_node = device_node->next_sibling("device"))
    {
        upnp_device& device = devices.emplace_back(parse_device(device_node));
        apply_url_base(device, url_base);
    }

    if(devices.empty())
        throw description_error {"description has no device element"};

    return devices;
}

std::string device_urn(std::string_view device_type, int device_version)
{
    return fmt::format("urn:schemas-upnp-org:device:{}:{}", device_type, device_version);
}

} // namespace upnp
