#include "core/types/Target.hpp"

#include <asio/ip/address.hpp>

#include <algorithm>
#include <cctype>

namespace pingsweep::core {

namespace {

constexpr std::size_t MAX_HOSTNAME_LENGTH = 253;
constexpr std::size_t MAX_LABEL_LENGTH = 63;

bool isAllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

} // namespace

std::string normalizeIdentifier(const std::string& identifier) {
    auto begin = identifier.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = identifier.find_last_not_of(" \t\r\n");

    std::string normalized = identifier.substr(begin, end - begin + 1);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

bool isIpLiteral(const std::string& identifier) {
    if (identifier.empty()) {
        return false;
    }
    asio::error_code ec;
    asio::ip::make_address(identifier, ec);
    return !ec;
}

bool isValidHostname(const std::string& identifier) {
    if (identifier.empty() || identifier.size() > MAX_HOSTNAME_LENGTH) {
        return false;
    }

    std::string lastLabel;
    std::size_t start = 0;
    while (start <= identifier.size()) {
        auto dot = identifier.find('.', start);
        auto end = dot == std::string::npos ? identifier.size() : dot;
        std::string label = identifier.substr(start, end - start);

        if (label.empty() || label.size() > MAX_LABEL_LENGTH) {
            return false;
        }
        if (label.front() == '-' || label.back() == '-') {
            return false;
        }
        for (unsigned char c : label) {
            if (std::isalnum(c) == 0 && c != '-') {
                return false;
            }
        }

        lastLabel = std::move(label);
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    // "10.0.0.300" looks like a hostname but is a broken IPv4 literal
    if (identifier.find('.') != std::string::npos && isAllDigits(lastLabel)) {
        return isIpLiteral(identifier);
    }
    return true;
}

bool isValidTargetIdentifier(const std::string& identifier) {
    return isIpLiteral(identifier) || isValidHostname(identifier);
}

} // namespace pingsweep::core
