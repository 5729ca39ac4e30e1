#include "utils/HttpMessage.hpp"

#include <httplib.h>

#include <array>
#include <cctype>

namespace vitco::http {
    namespace {
        constexpr std::array<std::string_view, 11> TRANSPORT_HEADERS{
            "Host",
            "Content-Length",
            "Transfer-Encoding",
            "Connection",
            "Keep-Alive",
            "Upgrade",
            "Proxy-Connection",
            "REMOTE_ADDR",
            "REMOTE_PORT",
            "LOCAL_ADDR",
            "LOCAL_PORT",
        };
    }

    bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    Result<Origin> splitOrigin(std::string_view url) {
        const auto schemeEnd{url.find("://")};
        if (schemeEnd == std::string_view::npos) {
            return Result<Origin>::Error(ErrorCode::InvalidArgument, "not an absolute URL: " + std::string{url});
        }
        const auto scheme{url.substr(0, schemeEnd)};
        if (!equalsIgnoreCase(scheme, "http") && !equalsIgnoreCase(scheme, "https")) {
            return Result<Origin>::Error(ErrorCode::InvalidArgument, "unsupported scheme: " + std::string{scheme});
        }

        const auto hostStart{schemeEnd + 3};
        const auto pathStart{url.find('/', hostStart)};
        const auto authority{url.substr(hostStart, pathStart == std::string_view::npos ? std::string_view::npos : pathStart - hostStart)};
        if (authority.empty()) {
            return Result<Origin>::Error(ErrorCode::InvalidArgument, "URL has no host: " + std::string{url});
        }

        Origin origin{};
        origin.schemeHostPort = std::string{url.substr(0, hostStart)} + std::string{authority};
        if (pathStart != std::string_view::npos) {
            origin.path = std::string{url.substr(pathStart)};
        }
        return Result<Origin>::Ok(std::move(origin));
    }

    std::string joinUrl(std::string_view base, std::string_view path) {
        while (!base.empty() && base.back() == '/') {
            base.remove_suffix(1);
        }
        while (!path.empty() && path.front() == '/') {
            path.remove_prefix(1);
        }
        std::string out{base};
        out += '/';
        out += path;
        return out;
    }

    std::optional<std::string> findHeader(const Headers& headers, std::string_view name) {
        for (const auto& [key, value] : headers) {
            if (equalsIgnoreCase(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    bool isTransportHeader(std::string_view name) noexcept {
        for (const auto header : TRANSPORT_HEADERS) {
            if (equalsIgnoreCase(header, name)) {
                return true;
            }
        }
        return false;
    }

    Request fromLibrary(const httplib::Request& request) {
        Request out{
            .method = request.method,
            .target = request.target.empty() ? request.path : request.target,
            .body = request.body,
        };
        for (const auto& [name, value] : request.headers) {
            if (!isTransportHeader(name)) {
                out.headers.emplace_back(name, value);
            }
        }
        return out;
    }

    void toLibrary(const Response& response, httplib::Response& out) {
        out.status = response.status;
        for (const auto& [name, value] : response.headers) {
            if (!isTransportHeader(name)) {
                out.set_header(name, value);
            }
        }
        out.body = response.body;
    }

}
