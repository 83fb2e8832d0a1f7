#include "core/discovery.hpp"
#include "common/protocol.hpp"
#include "common/endian.hpp"
#include "common/helpers.hpp"
#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>

namespace buspro {

namespace {

const DeviceTypeInfo DEVICE_TYPES[] = {
    // Dimmers and generic light modules
    {0x0001, DeviceCategory::LIGHT, "HDL-DIMMER", false},
    {0x0178, DeviceCategory::LIGHT, "HDL-MPDI06.40K", false},
    {0x0251, DeviceCategory::LIGHT, "HDL-MD0X04.40", false},
    {0x0254, DeviceCategory::LIGHT, "HDL-MLED02.40K", false},
    {0x0255, DeviceCategory::LIGHT, "HDL-MLED01.40K", false},
    {0x0260, DeviceCategory::LIGHT, "HDL-DN-DT0601", false},
    {0x026D, DeviceCategory::LIGHT, "HDL-MDT0601", false},

    // Relays and logic
    {0x0002, DeviceCategory::SWITCH, "HDL-RELAY", false},
    {0x0188, DeviceCategory::SWITCH, "HDL-MR0810.433", false},
    {0x0189, DeviceCategory::SWITCH, "HDL-MR1610.431", false},
    {0x018A, DeviceCategory::SWITCH, "HDL-MR0416.432", false},
    {0x01AC, DeviceCategory::SWITCH, "HDL-R0816", false},
    {0x0453, DeviceCategory::SWITCH, "HDL-DN-Logic960", false},

    // Curtains
    {0x0180, DeviceCategory::COVER, "HDL-MW02.431", false},
    {0x0182, DeviceCategory::COVER, "HDL-MW04.431", false},

    // HVAC, DLP and Granite panels
    {0x0073, DeviceCategory::CLIMATE, "HDL-MFHC01.431", false},
    {0x0174, DeviceCategory::CLIMATE, "HDL-MPWPID01.48", false},
    {0x0270, DeviceCategory::CLIMATE, "HDL-MAC01.431", false},
    {0x0077, DeviceCategory::CLIMATE, "HDL-DRY-4Z", false},
    {0x0028, DeviceCategory::CLIMATE, "HDL-DLP", false},
    {0x002A, DeviceCategory::CLIMATE, "HDL-DLP-EU", false},
    {0x0086, DeviceCategory::CLIMATE, "HDL-DLP2", false},
    {0x0095, DeviceCategory::CLIMATE, "HDL-DLP-OLD", false},
    {0x009C, DeviceCategory::CLIMATE, "HDL-DLPv2", false},
    {0x0100, DeviceCategory::CLIMATE, "HDL-MPTL14.46", false},
    {0x01CC, DeviceCategory::CLIMATE, "HDL-MPTLC43.46", false},
    {0x01CD, DeviceCategory::CLIMATE, "HDL-MPTLC70.46", false},
    {0x0112, DeviceCategory::CLIMATE, "HDL-MPTLX.46", false},
    {0x010D, DeviceCategory::CLIMATE, "HDL-MPTLPro.46", false},
    {0x03E8, DeviceCategory::CLIMATE, "HDL-MPTL4.3.47", false},
    {0x03E9, DeviceCategory::CLIMATE, "HDL-MPTL7.47", false},

    // Motion sensors, button panels, security
    {0x018C, DeviceCategory::BINARY_SENSOR, "HDL-MSPU05.4C", false},
    {0x018D, DeviceCategory::BINARY_SENSOR, "HDL-MS05M.4C", false},
    {0x0010, DeviceCategory::BINARY_SENSOR, "HDL-MPL8.48", false},
    {0x0011, DeviceCategory::BINARY_SENSOR, "HDL-MPL4.48", false},
    {0x0012, DeviceCategory::BINARY_SENSOR, "HDL-MPT4.46", false},
    {0x0013, DeviceCategory::BINARY_SENSOR, "HDL-MPE04.48", false},
    {0x0014, DeviceCategory::BINARY_SENSOR, "HDL-MP2B.48", false},
    {0x012B, DeviceCategory::BINARY_SENSOR, "HDL-WS8M", false},
    {0x0BE9, DeviceCategory::BINARY_SENSOR, "HDL-DN-SEC250K", false},

    // Multisensors
    {0x018E, DeviceCategory::SENSOR, "HDL-MS12.2C", false},
    {0x0134, DeviceCategory::SENSOR, "HDL-CMS-12in1", false},
    {0x0135, DeviceCategory::SENSOR, "HDL-CMS-8in1", false},
    {0x0150, DeviceCategory::SENSOR, "HDL-MSP07M", false},

    // Bus interfaces
    {0x0192, DeviceCategory::LIGHT, "HDL-MBUS01.431", true},
    {0x0195, DeviceCategory::LIGHT, "HDL-MNETC.431", true},
};

std::string type_to_hex(uint16_t type_code)
{
    std::ostringstream oss;
    oss << "0x" << std::uppercase << std::hex << std::setfill('0') << std::setw(4) << type_code;
    return oss.str();
}

std::string device_address(uint8_t subnet, uint8_t device)
{
    return std::to_string(subnet) + "." + std::to_string(device);
}

std::string read_remark(const std::vector<uint8_t>& payload)
{
    std::string remark;
    size_t end = std::min(payload.size(), Protocol::Discovery::REMARK_OFFSET + Protocol::Discovery::REMARK_LEN);
    for (size_t i = Protocol::Discovery::REMARK_OFFSET; i < end; ++i) {
        if (payload[i] == 0) break;
        remark.push_back(static_cast<char>(payload[i]));
    }
    while (!remark.empty() && remark.back() == ' ') {
        remark.pop_back();
    }
    return remark;
}

} // anonymous namespace

const DeviceTypeInfo* find_device_type(uint16_t type_code)
{
    for (const auto& info : DEVICE_TYPES) {
        if (info.type_code == type_code) {
            return &info;
        }
    }
    return nullptr;
}

int max_channels(DeviceCategory category)
{
    switch (category) {
        case DeviceCategory::LIGHT: return 12;
        case DeviceCategory::COVER: return 2;
        case DeviceCategory::CLIMATE: return 1;
        case DeviceCategory::SENSOR: return 4;
        case DeviceCategory::BINARY_SENSOR: return 8;
        case DeviceCategory::SWITCH: return 12;
    }
    return 1;
}

// DeviceCatalog

size_t DeviceCatalog::merge(const DiscoveredDevice& device)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = std::make_pair(device.subnet, device.device);
    auto it = devices_.find(key);
    if (it == devices_.end()) {
        devices_.emplace(key, device);
        return device.channels.size();
    }

    size_t added = 0;
    for (uint8_t channel : device.channels) {
        if (it->second.channels.insert(channel).second) {
            added++;
        }
    }
    it->second.channel_count = static_cast<int>(it->second.channels.size());
    if (it->second.name.empty()) {
        it->second.name = device.name;
    }
    return added;
}

std::optional<DiscoveredDevice> DeviceCatalog::find(uint8_t subnet, uint8_t device) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(std::make_pair(subnet, device));
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DiscoveredDevice> DeviceCatalog::by_category(DeviceCategory category) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiscoveredDevice> result;
    for (const auto& entry : devices_) {
        if (entry.second.category == category) {
            result.push_back(entry.second);
        }
    }
    return result;
}

DeviceMap DeviceCatalog::grouped() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceMap result;
    for (const auto& entry : devices_) {
        result[entry.second.category].push_back(entry.second);
    }
    return result;
}

std::vector<std::pair<DeviceKey, DeviceCategory>> DeviceCatalog::channel_keys() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<DeviceKey, DeviceCategory>> keys;
    for (const auto& entry : devices_) {
        const auto& d = entry.second;
        for (uint8_t channel : d.channels) {
            keys.emplace_back(DeviceKey{d.subnet, d.device, channel}, d.category);
        }
    }
    return keys;
}

void DeviceCatalog::note_unknown_type(uint16_t type_code)
{
    std::lock_guard<std::mutex> lock(mutex_);
    unknown_types_.insert(type_code);
}

std::set<uint16_t> DeviceCatalog::unknown_types() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return unknown_types_;
}

size_t DeviceCatalog::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

size_t DeviceCatalog::channel_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : devices_) {
        count += entry.second.channels.size();
    }
    return count;
}

void DeviceCatalog::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();
    unknown_types_.clear();
}

// DiscoveryEngine

DiscoveryEngine::DiscoveryEngine(EventDispatcher& dispatcher, DeviceCatalog& catalog,
                                 CommandFunction command, Logger& logger)
    : dispatcher_(dispatcher),
      catalog_(catalog),
      command_(std::move(command)),
      logger_(logger),
      source_subnet_(Protocol::Address::DEFAULT_SOURCE_SUBNET),
      source_device_(Protocol::Address::DEFAULT_SOURCE_DEVICE),
      repeats_(Protocol::Discovery::REPEATS),
      gap_(Protocol::DISCOVERY_GAP_MS),
      first_subnet_(Protocol::Discovery::FIRST_SUBNET),
      last_subnet_(Protocol::Discovery::LAST_SUBNET) {}

void DiscoveryEngine::set_source(uint8_t subnet, uint8_t device)
{
    source_subnet_ = subnet;
    source_device_ = device;
}

void DiscoveryEngine::set_repeats(int repeats, std::chrono::milliseconds gap)
{
    repeats_ = std::max(1, repeats);
    gap_ = gap;
}

void DiscoveryEngine::set_subnet_range(uint8_t first, uint8_t last)
{
    first_subnet_ = std::min(first, last);
    last_subnet_ = std::max(first, last);
}

std::vector<DiscoveredDevice> DiscoveryEngine::scan_subnet(uint8_t subnet, std::chrono::milliseconds timeout)
{
    return scan({subnet}, timeout);
}

DeviceMap DiscoveryEngine::discover(std::optional<uint8_t> subnet, std::chrono::milliseconds timeout)
{
    std::vector<uint8_t> subnets;
    if (subnet) {
        subnets.push_back(*subnet);
    } else {
        for (int s = first_subnet_; s <= last_subnet_; ++s) {
            subnets.push_back(static_cast<uint8_t>(s));
        }
    }

    logger_.info("Discovering devices on " + std::to_string(subnets.size()) + " subnet(s)");
    scan(subnets, timeout);
    log_summary();
    return catalog_.grouped();
}

std::optional<DiscoveredDevice> DiscoveryEngine::record_reply(const Telegram& reply)
{
    if (reply.operate_code != Protocol::OperateCode::DISCOVERY_RESPONSE) {
        return std::nullopt;
    }

    const std::string address = device_address(reply.source_subnet, reply.source_device);
    if (reply.source_subnet == 0 || reply.source_device == 0) {
        logger_.warning("Ignoring discovery reply from invalid address " + address);
        return std::nullopt;
    }

    const auto& payload = reply.payload;
    if (payload.size() < Protocol::Discovery::CHANNEL_OFFSET) {
        logger_.warning("Ignoring short discovery reply from " + address);
        return std::nullopt;
    }

    uint16_t type_code = read_be16(payload.data() + Protocol::Discovery::TYPE_OFFSET);
    if (type_code == 0) {
        logger_.warning("Ignoring discovery reply with type code 0 from " + address);
        return std::nullopt;
    }

    const DeviceTypeInfo* info = find_device_type(type_code);
    if (info && info->ignored) {
        logger_.debug("Skipping bus interface " + std::string(info->model) + " at " + address);
        return std::nullopt;
    }

    DeviceCategory category = DeviceCategory::LIGHT;
    if (info) {
        category = info->category;
    } else {
        logger_.warning("Unknown device type " + type_to_hex(type_code) + " at " + address + ", treating as light");
        catalog_.note_unknown_type(type_code);
    }

    int count = 0;
    if (payload.size() > Protocol::Discovery::CHANNEL_OFFSET) {
        count = payload[Protocol::Discovery::CHANNEL_OFFSET];
    }
    if (count == 0) {
        count = 1;
    }
    int limit = max_channels(category);
    if (count > limit) {
        logger_.warning("Device " + address + " reports " + std::to_string(count) + " channels, " +
                        category_to_string(category) + " allows " + std::to_string(limit));
        count = limit;
    }

    DiscoveredDevice device;
    device.subnet = reply.source_subnet;
    device.device = reply.source_device;
    device.type_code = type_code;
    device.category = category;
    device.channel_count = count;
    for (int channel = 1; channel <= count; ++channel) {
        device.channels.insert(static_cast<uint8_t>(channel));
    }
    device.model = info ? info->model : type_to_hex(type_code);
    device.name = read_remark(payload);

    size_t added = catalog_.merge(device);
    if (added > 0) {
        logger_.info("Found " + std::string(category_to_string(category)) + " " + device.model + " at " +
                     address + " (" + std::to_string(count) + " channel(s))");
    }
    return catalog_.find(device.subnet, device.device);
}

void DiscoveryEngine::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
}

void DiscoveryEngine::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
}

std::vector<DiscoveredDevice> DiscoveryEngine::scan(const std::vector<uint8_t>& subnets,
                                                    std::chrono::milliseconds timeout)
{
    struct Collector
    {
        std::mutex mutex;
        std::vector<Telegram> replies;
    };
    auto collector = std::make_shared<Collector>();
    std::set<uint8_t> wanted(subnets.begin(), subnets.end());

    // Handlers may still run briefly after unsubscribe, so the collector is shared
    SubscriptionId listener = dispatcher_.subscribe_all([collector, wanted](const Telegram& t) {
        if (t.operate_code == Protocol::OperateCode::DISCOVERY_RESPONSE && wanted.count(t.source_subnet)) {
            std::lock_guard<std::mutex> lock(collector->mutex);
            collector->replies.push_back(t);
        }
    });

    bool active = true;
    for (int round = 0; round < repeats_ && active; ++round) {
        for (uint8_t subnet : subnets) {
            send_request(subnet);
        }
        if (round + 1 < repeats_) {
            active = wait_for(gap_);
        }
    }
    if (active) {
        wait_for(timeout);
    }

    dispatcher_.unsubscribe(listener);

    std::vector<Telegram> replies;
    {
        std::lock_guard<std::mutex> lock(collector->mutex);
        replies.swap(collector->replies);
    }

    std::vector<DiscoveredDevice> found;
    std::set<std::pair<uint8_t, uint8_t>> seen;
    for (const auto& reply : replies) {
        auto device = record_reply(reply);
        if (device && seen.insert(std::make_pair(device->subnet, device->device)).second) {
            found.push_back(*device);
        }
    }

    // Entries were copied when first seen; report their final channel sets
    for (auto& device : found) {
        if (auto latest = catalog_.find(device.subnet, device.device)) {
            device = *latest;
        }
    }
    return found;
}

bool DiscoveryEngine::send_request(uint8_t subnet)
{
    Telegram request;
    request.source_subnet = source_subnet_;
    request.source_device = source_device_;
    request.target_subnet = subnet;
    request.target_device = Protocol::Address::BROADCAST;
    request.operate_code = Protocol::OperateCode::DISCOVERY;

    if (!command_(request)) {
        logger_.warning("Failed to send discovery request to subnet " + std::to_string(subnet));
        return false;
    }
    return true;
}

bool DiscoveryEngine::wait_for(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this]() { return stopping_; });
}

void DiscoveryEngine::log_summary()
{
    auto grouped = catalog_.grouped();
    std::ostringstream oss;
    oss << "Discovery finished: " << catalog_.size() << " device(s)";
    for (const auto& [category, devices] : grouped) {
        oss << ", " << category_to_string(category) << " " << devices.size();
    }
    logger_.info(oss.str());

    auto unknown = catalog_.unknown_types();
    if (!unknown.empty()) {
        std::string codes;
        for (uint16_t code : unknown) {
            if (!codes.empty()) codes += ", ";
            codes += type_to_hex(code);
        }
        logger_.warning("Unknown device types: " + codes);
    }
}

} // namespace buspro
