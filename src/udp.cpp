#include "transport/udp.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace buspro {

UdpTransport::UdpTransport(DatagramHandler handler, Logger& logger)
    : handler_(std::move(handler)), logger_(logger) {}

UdpTransport::~UdpTransport()
{
    stop();
}

Result<bool> UdpTransport::start(int local_port)
{
    if (fd_.load() >= 0) {
        return Result<bool>::success(true);
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        logger_.error(std::string("Failed to create UDP socket: ") + strerror(errno));
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    int enable = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0) {
        logger_.error(std::string("Failed to enable broadcast: ") + strerror(errno));
        ::close(fd);
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(static_cast<uint16_t>(local_port));

    if (::bind(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        logger_.error("Failed to bind UDP port " + std::to_string(local_port) + ": " + strerror(errno));
        ::close(fd);
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd, (struct sockaddr*)&addr, &addr_len) == 0) {
        local_port_ = ntohs(addr.sin_port);
    }

    fd_.store(fd);
    running_.store(true);
    receive_thread_ = std::thread([this]() { receive_loop(); });

    logger_.info("UDP transport listening on port " + std::to_string(local_port_));
    return Result<bool>::success(true);
}

void UdpTransport::stop()
{
    running_.store(false);
    if (receive_thread_.joinable()) {
        receive_thread_.join();
    }

    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
        logger_.info("UDP transport stopped");
    }
}

Result<size_t> UdpTransport::send(const std::vector<uint8_t>& data, const std::string& host, int port)
{
    int fd = fd_.load();
    if (fd < 0) {
        return Result<size_t>::failure(Error::TRANSPORT_ERROR);
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        logger_.error("Invalid address " + host);
        return Result<size_t>::failure(Error::TRANSPORT_ERROR);
    }

    std::lock_guard<std::mutex> lock(send_mutex_);
    ssize_t sent = ::sendto(fd, data.data(), data.size(), 0, (struct sockaddr*)&addr, sizeof(addr));
    if (sent != static_cast<ssize_t>(data.size())) {
        logger_.warning("Send to " + host + ":" + std::to_string(port) + " failed: " + strerror(errno));
        return Result<size_t>::failure(Error::TRANSPORT_ERROR);
    }

    return Result<size_t>::success(static_cast<size_t>(sent));
}

void UdpTransport::receive_loop()
{
    uint8_t buffer[2048];

    while (running_.load()) {
        int fd = fd_.load();
        if (fd < 0) break;

        struct pollfd pfd = {fd, POLLIN, 0};
        int ret = poll(&pfd, 1, 50);
        if (ret < 0) {
            if (errno == EINTR) continue;
            logger_.error(std::string("UDP poll failed: ") + strerror(errno));
            break;
        }
        if (ret == 0) continue;

        struct sockaddr_in from;
        socklen_t from_len = sizeof(from);
        ssize_t n = ::recvfrom(fd, buffer, sizeof(buffer), 0, (struct sockaddr*)&from, &from_len);
        if (n < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                logger_.warning(std::string("UDP receive failed: ") + strerror(errno));
            }
            continue;
        }

        char host[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &from.sin_addr, host, sizeof(host));
        Endpoint endpoint{host, ntohs(from.sin_port)};

        if (handler_) {
            handler_(std::vector<uint8_t>(buffer, buffer + n), endpoint);
        }
    }
}

} // namespace buspro
