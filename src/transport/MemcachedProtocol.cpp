#include "memocache/transport/MemcachedProtocol.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace memocache {
namespace transport {
namespace memcached {

namespace {

// Reads the line starting at pos (without CRLF). next is the offset after CRLF.
bool readLine(const std::string& buffer, size_t pos, std::string& line, size_t& next) {
    auto crlf = buffer.find("\r\n", pos);
    if (crlf == std::string::npos) return false;
    line = buffer.substr(pos, crlf - pos);
    next = crlf + 2;
    return true;
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool isErrorLine(const std::string& line) {
    return line == "ERROR" || startsWith(line, "CLIENT_ERROR") || startsWith(line, "SERVER_ERROR");
}

// Parses a "VALUE <key> <flags> <bytes>[ <cas>]" header, returns the data length.
bool parseValueHeader(const std::string& line, size_t& bytes) {
    std::istringstream in(line);
    std::string tag, key, flags, length;
    if (!(in >> tag >> key >> flags >> length) || tag != "VALUE") {
        return false;
    }
    try {
        size_t idx = 0;
        const unsigned long long n = std::stoull(length, &idx);
        if (idx != length.size()) return false;
        bytes = static_cast<size_t>(n);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

} // namespace

bool isValidKey(const std::string& key) {
    if (key.empty() || key.size() > kMaxKeyLength) return false;
    for (unsigned char c : key) {
        if (std::iscntrl(c) || std::isspace(c)) return false;
    }
    return true;
}

std::int64_t toExptime(std::int64_t ttlSeconds, std::time_t now) {
    if (ttlSeconds <= kMaxRelativeExptime) {
        return ttlSeconds;
    }
    return static_cast<std::int64_t>(now) + ttlSeconds;
}

std::string encodeGet(const std::string& key) {
    return "get " + key + "\r\n";
}

std::string encodeSet(const std::string& key, const std::string& value,
                      std::uint32_t flags, std::int64_t exptime) {
    std::string out = "set " + key + " " + std::to_string(flags) + " " +
                      std::to_string(exptime) + " " + std::to_string(value.size()) + "\r\n";
    out.reserve(out.size() + value.size() + 2);
    out += value;
    out += "\r\n";
    return out;
}

ParseStatus parseGetReply(const std::string& buffer, GetReply& out, size_t& consumed) {
    size_t pos = 0;
    std::string line;
    size_t next = 0;
    std::optional<std::string> value;

    while (true) {
        if (!readLine(buffer, pos, line, next)) {
            return ParseStatus::Incomplete;
        }
        if (line == "END") {
            out.value = std::move(value);
            out.error.reset();
            consumed = next;
            return ParseStatus::Complete;
        }
        if (isErrorLine(line)) {
            out.value.reset();
            out.error = line;
            consumed = next;
            return ParseStatus::Complete;
        }
        size_t bytes = 0;
        if (!parseValueHeader(line, bytes)) {
            return ParseStatus::Malformed;
        }
        if (buffer.size() - next < bytes || buffer.size() - next - bytes < 2) {
            return ParseStatus::Incomplete;
        }
        const size_t dataEnd = next + bytes;
        if (buffer.compare(dataEnd, 2, "\r\n") != 0) {
            return ParseStatus::Malformed;
        }
        if (!value) {
            value = buffer.substr(next, bytes);
        }
        pos = dataEnd + 2;
    }
}

ParseStatus parseStoreReply(const std::string& buffer, StoreReply& out, size_t& consumed) {
    std::string line;
    size_t next = 0;
    if (!readLine(buffer, 0, line, next)) {
        return ParseStatus::Incomplete;
    }
    if (line == "STORED") {
        out.outcome = StoreOutcome::Stored;
    } else if (line == "NOT_STORED") {
        out.outcome = StoreOutcome::NotStored;
    } else if (line == "EXISTS") {
        out.outcome = StoreOutcome::Exists;
    } else if (line == "NOT_FOUND") {
        out.outcome = StoreOutcome::NotFound;
    } else if (isErrorLine(line)) {
        out.outcome = StoreOutcome::Error;
        out.message = line;
    } else {
        return ParseStatus::Malformed;
    }
    consumed = next;
    return ParseStatus::Complete;
}

} // namespace memcached
} // namespace transport
} // namespace memocache
