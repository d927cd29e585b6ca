#include "podbridge/bluetooth/device.hpp"

#include <cctype>

namespace podbridge::bluetooth {

bool is_online(const Device& device, std::chrono::system_clock::time_point now,
               std::chrono::milliseconds offline_threshold) {
    if (device.last_seen == std::chrono::system_clock::time_point{}) {
        return false;
    }
    return now - device.last_seen < offline_threshold;
}

std::optional<std::string> normalize_mac(std::string_view text) {
    constexpr std::size_t kMacLength = 17;
    if (text.size() != kMacLength) {
        return std::nullopt;
    }

    std::string out;
    out.reserve(kMacLength);
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto ch = static_cast<unsigned char>(text[i]);
        if (i % 3 == 2) {
            if (ch != ':' && ch != '-') {
                return std::nullopt;
            }
            out.push_back(':');
            continue;
        }
        if (!std::isxdigit(ch)) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(std::toupper(ch)));
    }
    return out;
}

}  // namespace podbridge::bluetooth
