#include "memocache/transport/MemcachedTransport.hpp"
#include "memocache/transport/MemcachedProtocol.hpp"
#include "memocache/logging/Logging.hpp"
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace memocache {
namespace transport {

// ==================== ServerAddress ====================

ServerAddress ServerAddress::parse(const std::string& address) {
    ServerAddress result;
    std::string portPart;

    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Invalid server address: " + address);
        }
        result.host = address.substr(1, close - 1);
        if (close + 1 < address.size()) {
            if (address[close + 1] != ':') {
                throw std::invalid_argument("Invalid server address: " + address);
            }
            portPart = address.substr(close + 2);
        }
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            result.host = address;
        } else {
            result.host = address.substr(0, colon);
            portPart = address.substr(colon + 1);
        }
    }

    if (result.host.empty()) {
        throw std::invalid_argument("Invalid server address: " + address);
    }
    if (!portPart.empty()) {
        size_t idx = 0;
        unsigned long port = 0;
        try {
            port = std::stoul(portPart, &idx);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid port in server address: " + address);
        }
        if (idx != portPart.size() || port == 0 || port > 65535) {
            throw std::invalid_argument("Invalid port in server address: " + address);
        }
        result.port = static_cast<std::uint16_t>(port);
    }
    return result;
}

std::string ServerAddress::toString() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

// ==================== MemcachedTransportOptions ====================

MemcachedTransportOptions MemcachedTransportOptions::fromJson(const nlohmann::json& j) {
    MemcachedTransportOptions options;
    if (j.is_null()) {
        return options;
    }
    if (!j.is_object()) {
        throw std::invalid_argument("transportOptions must be a JSON object");
    }
    try {
        options.threads = j.value("threads", options.threads);
        options.connectTimeout = std::chrono::milliseconds(
            j.value("connectTimeout", static_cast<std::int64_t>(options.connectTimeout.count())));
        options.ioTimeout = std::chrono::milliseconds(
            j.value("ioTimeout", static_cast<std::int64_t>(options.ioTimeout.count())));
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid transportOptions: ") + e.what());
    }
    if (!options.validate()) {
        throw std::invalid_argument("Invalid transportOptions: threads and timeouts must be positive");
    }
    return options;
}

// ==================== ServerConnection ====================

class MemcachedTransport::ServerConnection {
public:
    using Parser = std::function<memcached::ParseStatus(const std::string&, size_t&)>;

    ServerConnection(ServerAddress address, const MemcachedTransportOptions& options)
        : address_(std::move(address)), options_(options) {}

    ~ServerConnection() {
        closeSocket();
    }

    // Sends request and reads until parse() reports a complete reply.
    // Returns the error text on failure; the socket is then closed and the
    // next request reconnects.
    std::optional<std::string> roundTrip(const std::string& request, const Parser& parse) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (auto error = ensureConnected()) {
            return error;
        }
        if (auto error = sendAll(request)) {
            return fail(*error);
        }

        std::string buffer;
        char chunk[4096];
        while (true) {
            ssize_t received = ::recv(fd_, chunk, sizeof(chunk), 0);
            if (received == 0) {
                return fail("connection closed by server");
            }
            if (received < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    return fail("read timed out");
                }
                return fail(std::string("recv failed: ") + std::strerror(errno));
            }
            buffer.append(chunk, static_cast<size_t>(received));

            size_t consumed = 0;
            switch (parse(buffer, consumed)) {
                case memcached::ParseStatus::Complete:
                    if (consumed != buffer.size()) {
                        // Trailing bytes would desynchronize the next reply
                        return fail("unexpected data after reply");
                    }
                    return std::nullopt;
                case memcached::ParseStatus::Malformed:
                    return fail("malformed reply");
                case memcached::ParseStatus::Incomplete:
                    break;
            }
        }
    }

    const ServerAddress& address() const { return address_; }

private:
    std::optional<std::string> ensureConnected() {
        if (fd_ >= 0) {
            return std::nullopt;
        }

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* results = nullptr;
        const std::string port = std::to_string(address_.port);
        int rc = ::getaddrinfo(address_.host.c_str(), port.c_str(), &hints, &results);
        if (rc != 0) {
            return std::string("resolve failed for ") + address_.toString() + ": " + ::gai_strerror(rc);
        }

        std::string lastError = "no address";
        for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
            int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) {
                lastError = std::string("socket failed: ") + std::strerror(errno);
                continue;
            }
            if (auto error = connectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen)) {
                lastError = *error;
                ::close(fd);
                continue;
            }
            configureSocket(fd);
            fd_ = fd;
            break;
        }
        ::freeaddrinfo(results);

        if (fd_ < 0) {
            logging::getLogger()->warn("MemcachedTransport[{}]: connect failed: {}",
                                       address_.toString(), lastError);
            return "connect to " + address_.toString() + " failed: " + lastError;
        }
        logging::getLogger()->debug("MemcachedTransport[{}]: connected", address_.toString());
        return std::nullopt;
    }

    std::optional<std::string> connectWithTimeout(int fd, const sockaddr* addr, socklen_t len) {
        const int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            return std::string("fcntl failed: ") + std::strerror(errno);
        }

        if (::connect(fd, addr, len) < 0) {
            if (errno != EINPROGRESS) {
                return std::string(std::strerror(errno));
            }
            pollfd pfd{fd, POLLOUT, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(options_.connectTimeout.count()));
            if (ready == 0) {
                return std::string("connect timed out");
            }
            if (ready < 0) {
                return std::string("poll failed: ") + std::strerror(errno);
            }
            int soError = 0;
            socklen_t soLen = sizeof(soError);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soLen) < 0) {
                return std::string("getsockopt failed: ") + std::strerror(errno);
            }
            if (soError != 0) {
                return std::string(std::strerror(soError));
            }
        }

        if (::fcntl(fd, F_SETFL, flags) < 0) {
            return std::string("fcntl failed: ") + std::strerror(errno);
        }
        return std::nullopt;
    }

    void configureSocket(int fd) {
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(options_.ioTimeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((options_.ioTimeout.count() % 1000) * 1000);
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    }

    std::optional<std::string> sendAll(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    return std::string("write timed out");
                }
                return std::string("send failed: ") + std::strerror(errno);
            }
            sent += static_cast<size_t>(n);
        }
        return std::nullopt;
    }

    std::string fail(const std::string& error) {
        logging::getLogger()->warn("MemcachedTransport[{}]: {}", address_.toString(), error);
        closeSocket();
        return error;
    }

    void closeSocket() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    ServerAddress address_;
    MemcachedTransportOptions options_;
    std::mutex mutex_;
    int fd_ = -1;
};

// ==================== MemcachedTransport ====================

MemcachedTransport::MemcachedTransport(const std::vector<std::string>& servers, const nlohmann::json& options)
    : options_(MemcachedTransportOptions::fromJson(options)) {
    if (servers.empty()) {
        throw std::invalid_argument("MemcachedTransport: server list is empty");
    }
    for (const auto& server : servers) {
        connections_.push_back(std::make_unique<ServerConnection>(ServerAddress::parse(server), options_));
    }

    thread::ThreadPoolConfig poolConfig;
    poolConfig.minThreads = options_.threads;
    poolConfig.maxThreads = options_.threads;
    poolConfig.queueSize = 0;
    poolConfig.name = "memcached";
    pool_ = std::make_unique<thread::ThreadPool>(poolConfig);

    logging::getLogger()->info("MemcachedTransport: {} server(s), {} worker thread(s)",
                               connections_.size(), options_.threads);
}

MemcachedTransport::~MemcachedTransport() {
    if (pool_) {
        pool_->stop();
    }
}

MemcachedTransport::ServerConnection& MemcachedTransport::route(const std::string& key) {
    if (connections_.size() == 1) {
        return *connections_.front();
    }
    return *connections_[std::hash<std::string>{}(key) % connections_.size()];
}

void MemcachedTransport::fetch(const std::string& key, FetchCallback callback) {
    if (!memcached::isValidKey(key)) {
        callback(std::string("invalid memcached key"), std::nullopt);
        return;
    }
    ServerConnection& connection = route(key);
    auto task = [&connection, key, callback]() {
        memcached::GetReply reply;
        auto error = connection.roundTrip(memcached::encodeGet(key),
            [&reply](const std::string& buffer, size_t& consumed) {
                return memcached::parseGetReply(buffer, reply, consumed);
            });
        if (error) {
            callback(error, std::nullopt);
        } else if (reply.error) {
            callback(reply.error, std::nullopt);
        } else {
            callback(std::nullopt, reply.value);
        }
    };
    if (!pool_->enqueue(task)) {
        callback(std::string("transport is shutting down"), std::nullopt);
    }
}

void MemcachedTransport::store(const std::string& key, const std::string& value,
                               std::int64_t ttlSeconds, StoreCallback callback) {
    if (!memcached::isValidKey(key)) {
        callback(std::string("invalid memcached key"), false);
        return;
    }
    ServerConnection& connection = route(key);
    const std::int64_t exptime = memcached::toExptime(ttlSeconds, std::time(nullptr));
    auto task = [&connection, key, value, exptime, callback]() {
        memcached::StoreReply reply;
        auto error = connection.roundTrip(memcached::encodeSet(key, value, 0, exptime),
            [&reply](const std::string& buffer, size_t& consumed) {
                return memcached::parseStoreReply(buffer, reply, consumed);
            });
        if (error) {
            callback(error, false);
        } else if (reply.outcome == memcached::StoreOutcome::Error) {
            callback(reply.message, false);
        } else {
            callback(std::nullopt, reply.outcome == memcached::StoreOutcome::Stored);
        }
    };
    if (!pool_->enqueue(task)) {
        callback(std::string("transport is shutting down"), false);
    }
}

} // namespace transport
} // namespace memocache
