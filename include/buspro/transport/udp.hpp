#pragma once

#include <string>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <functional>
#include <stdint.h>

#include "common/types.hpp"
#include "common/log.hpp"

namespace buspro {

struct Endpoint
{
    std::string host;
    int port = 0;
};

class UdpTransport
{
public:
    using DatagramHandler = std::function<void(const std::vector<uint8_t>& data, const Endpoint& from)>;

    UdpTransport(DatagramHandler handler, Logger& logger);
    ~UdpTransport();

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    Result<bool> start(int local_port = 0);
    void stop();
    Result<size_t> send(const std::vector<uint8_t>& data, const std::string& host, int port);

    bool is_open() const { return fd_.load() >= 0; }
    int local_port() const { return local_port_; }

private:
    DatagramHandler handler_;
    Logger& logger_;
    std::atomic<int> fd_{-1};
    int local_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread receive_thread_;
    std::mutex send_mutex_;

    void receive_loop();
};

} // namespace buspro
