#include "whois_client.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <locale>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

const std::map<std::string, std::string> kWhoisServers = {
    {".com", "whois.verisign-grs.com"},
    {".net", "whois.verisign-grs.com"},
    {".org", "whois.pir.org"},
    {".info", "whois.afilias.net"},
    {".biz", "whois.neulevel.biz"},
    {".name", "whois.nic.name"},
    {".io", "whois.nic.io"},
    {".co", "whois.nic.co"},
    {".me", "whois.nic.me"},
    {".tv", "whois.nic.tv"},
    {".cc", "ccwhois.verisign-grs.com"},
    {".ws", "whois.website.ws"}
};

const char* const kDateFormats[] = {
    "%Y-%m-%dT%H:%M:%SZ",
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%d",
    "%d-%b-%Y",
    "%Y/%m/%d"
};

const char* const kAvailableMarkers[] = {"no match", "not found", "no data found"};

class Socket {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() {
        if (fd_ >= 0) ::close(fd_);
    }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int fd() const { return fd_; }

private:
    int fd_;
};

struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const { freeaddrinfo(ai); }
};

} // namespace

WhoisClient::WhoisClient(int timeout_ms)
    : timeout_ms_(timeout_ms) {}

std::string WhoisClient::server_for(const std::string& domain) {
    size_t dot = domain.rfind('.');
    if (dot == std::string::npos) return "";

    auto it = kWhoisServers.find(util::to_lower(domain.substr(dot)));
    return it == kWhoisServers.end() ? "" : it->second;
}

WhoisResult WhoisClient::lookup(const std::string& domain) const {
    WhoisResult result;
    result.checked_at = util::current_iso8601();

    std::string server = server_for(domain);
    if (server.empty()) {
        result.error = "No WHOIS server found for domain";
        return result;
    }

    try {
        result.raw_data = query_server(server, domain);
    } catch (const std::exception& e) {
        spdlog::warn("WHOIS lookup for {} via {} failed: {}", domain, server, e.what());
        result.error = e.what();
        return result;
    }

    parse(result.raw_data, result);
    return result;
}

std::string WhoisClient::query_server(const std::string& server, const std::string& domain) const {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    int rc = getaddrinfo(server.c_str(), "43", &hints, &raw);
    if (rc != 0) {
        throw std::runtime_error(
            fmt::format("failed to resolve WHOIS server {}: {}", server, gai_strerror(rc)));
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> addrs(raw);

    timeval tv{};
    tv.tv_sec = timeout_ms_ / 1000;
    tv.tv_usec = (timeout_ms_ % 1000) * 1000;

    std::string last_error = "no usable address";
    for (addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
        Socket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (sock.fd() < 0) {
            last_error = std::strerror(errno);
            continue;
        }

        if (setsockopt(sock.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
            setsockopt(sock.fd(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
            spdlog::warn("Could not set WHOIS socket timeout: {}", std::strerror(errno));
        }

        if (::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen) != 0) {
            last_error = std::strerror(errno);
            continue;
        }

        std::string request = domain + "\r\n";
        if (::send(sock.fd(), request.data(), request.size(), MSG_NOSIGNAL) !=
            static_cast<ssize_t>(request.size())) {
            throw std::runtime_error(fmt::format("failed to send query: {}", std::strerror(errno)));
        }

        std::string response;
        char buf[4096];
        for (;;) {
            ssize_t n = ::recv(sock.fd(), buf, sizeof(buf), 0);
            if (n == 0) break;
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(
                    fmt::format("failed to read response: {}", std::strerror(errno)));
            }
            response.append(buf, static_cast<size_t>(n));
        }

        spdlog::debug("WHOIS {} answered {} bytes for {}", server, response.size(), domain);
        return response;
    }

    throw std::runtime_error(
        fmt::format("failed to connect to WHOIS server: {}", last_error));
}

void WhoisClient::parse(const std::string& raw, WhoisResult& result) {
    for (auto line : util::split(raw, '\n')) {
        line = util::trim(line);
        if (line.empty()) continue;

        std::string lower = util::to_lower(line);
        for (const char* marker : kAvailableMarkers) {
            if (lower.find(marker) != std::string::npos) {
                result.available = true;
                return;
            }
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = util::to_lower(util::trim(line.substr(0, colon)));
        std::string value = util::trim(line.substr(colon + 1));

        if (key == "registrar") {
            result.registrar = value;
        } else if (key == "creation date" || key == "created" || key == "registration time") {
            if (auto date = parse_date(value)) result.registration_date = date;
        } else if (key == "expiry date" || key == "expires" || key == "expiration time" ||
                   key == "registry expiry date") {
            if (auto date = parse_date(value)) result.expiry_date = date;
        } else if (key == "updated date" || key == "last modified" || key == "last updated") {
            if (auto date = parse_date(value)) result.updated_date = date;
        } else if (key == "name server") {
            result.name_servers.push_back(value);
        } else if (key == "status" || key == "domain status") {
            result.status.push_back(value);
        }
    }

    if (!result.registrar.empty() || result.registration_date) {
        result.available = false;
    }
}

std::optional<std::string> WhoisClient::parse_date(const std::string& value) {
    for (const char* format : kDateFormats) {
        std::tm tm{};
        std::istringstream ss(value);
        ss.imbue(std::locale::classic());
        ss >> std::get_time(&tm, format);
        if (ss.fail()) continue;
        if (ss.peek() != std::char_traits<char>::eof()) continue;

        return fmt::format("{:04d}-{:02d}-{:02d}", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    }
    return std::nullopt;
}
