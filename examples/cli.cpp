#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <thread>
#include <chrono>
#include <atomic>
#include <signal.h>

#include "core/gateway.hpp"
#include "common/helpers.hpp"

volatile sig_atomic_t running = 1;
void sig_handler(int) { running = 0; }

std::atomic<bool> watching{false};

namespace {

void print_status(const buspro::DeviceKey& key, const buspro::DeviceStatus& status)
{
    std::cout << "  " << buspro::to_string(key) << ": ";
    if (auto* light = std::get_if<buspro::LightStatus>(&status)) {
        std::cout << (light->on ? "on " : "off ") << static_cast<int>(light->brightness) << "%";
    } else if (auto* cover = std::get_if<buspro::CoverStatus>(&status)) {
        std::cout << "position " << static_cast<int>(cover->position) << "%";
    } else if (auto* climate = std::get_if<buspro::ClimateStatus>(&status)) {
        std::cout << (climate->on ? "on" : "off") << " mode " << static_cast<int>(climate->mode)
                  << " current " << climate->current_temperature << " target " << climate->target_temperature;
    } else if (auto* sensor = std::get_if<buspro::SensorStatus>(&status)) {
        std::cout << "value " << sensor->value;
    } else if (auto* binary = std::get_if<buspro::BinaryStatus>(&status)) {
        std::cout << (binary->on ? "on" : "off");
    }
    std::cout << "\n";
}

// "1.23" -> {1, 23}
bool parse_address(const std::string& text, uint8_t& subnet, uint8_t& device)
{
    size_t dot = text.find('.');
    if (dot == std::string::npos) return false;
    int s = std::stoi(text.substr(0, dot));
    int d = std::stoi(text.substr(dot + 1));
    if (s < 0 || s > 255 || d < 0 || d > 255) return false;
    subnet = static_cast<uint8_t>(s);
    device = static_cast<uint8_t>(d);
    return true;
}

std::vector<uint8_t> parse_payload(int argc, char* argv[], int first)
{
    std::vector<uint8_t> payload;
    for (int i = first; i < argc; ++i) {
        payload.push_back(static_cast<uint8_t>(std::stoul(argv[i], nullptr, 0)));
    }
    return payload;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config> [subnet.device opcode [payload bytes...]]\n";
        return 1;
    }

    signal(SIGINT, sig_handler);

    std::string bad_line;
    auto config = buspro::load_config(argv[1], &bad_line);
    if (!config.ok()) {
        std::cerr << "Config error (" << buspro::error_to_string(config.error()) << "): " << bad_line << "\n";
        return 1;
    }

    std::cout << "=== Buspro Gateway ===" << std::endl;

    buspro::Gateway gateway(config.value());
    auto started = gateway.start();
    if (!started.ok()) {
        std::cout << "[FAIL] Start: " << buspro::error_to_string(started.error()) << "\n";
        return 1;
    }
    std::cout << "[OK] Listening on UDP port " << gateway.local_port() << "\n";

    // Raw request mode
    if (argc >= 4) {
        uint8_t subnet = 0, device = 0;
        uint16_t code = 0;
        std::vector<uint8_t> payload;
        try {
            if (!parse_address(argv[2], subnet, device)) {
                std::cerr << "Bad address: " << argv[2] << "\n";
                return 1;
            }
            code = static_cast<uint16_t>(std::stoul(argv[3], nullptr, 0));
            payload = parse_payload(argc, argv, 4);
        } catch (const std::exception& e) {
            std::cerr << "Bad argument: " << e.what() << "\n";
            return 1;
        }
        auto reply = gateway.send_message(subnet, device, code, payload);
        if (reply.ok()) {
            std::cout << "[OK] Reply: " << buspro::bytesToHex(reply.value()) << "\n";
        } else {
            std::cout << "[FAIL] " << buspro::error_to_string(reply.error()) << "\n";
        }
        gateway.stop();
        return reply.ok() ? 0 : 2;
    }

    std::cout << "\nDiscovering devices...\n";
    auto devices = gateway.discover();
    for (const auto& [category, list] : devices) {
        std::cout << buspro::category_to_string(category) << ":\n";
        for (const auto& d : list) {
            std::cout << "  " << static_cast<int>(d.subnet) << "." << static_cast<int>(d.device) << " "
                      << d.model << " (" << d.channel_count << " ch)";
            if (!d.name.empty()) std::cout << " \"" << d.name << "\"";
            std::cout << "\n";
            for (uint8_t channel : d.channels) {
                gateway.register_callback(d.subnet, d.device, channel,
                                          [](const buspro::StatusUpdate& u) {
                                              if (watching) print_status(u.key, u.status);
                                          },
                                          d.category);
            }
        }
    }

    std::cout << "\nPolling...\n";
    int refreshed = gateway.poll_now();
    std::cout << "[OK] " << refreshed << " channel(s) refreshed\n";
    for (const auto& [category, list] : devices) {
        for (const auto& d : list) {
            for (uint8_t channel : d.channels) {
                if (auto status = gateway.status(d.subnet, d.device, channel)) {
                    print_status(buspro::DeviceKey{d.subnet, d.device, channel}, *status);
                }
            }
        }
    }
    watching = true;

    std::cout << "\nWatching the bus, Ctrl+C to quit\n";
    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    gateway.stop();
    std::cout << "\n=== Done ===" << std::endl;
    return 0;
}
