#include "podbridge/bluetooth/output_parser.hpp"

#include <cctype>
#include <regex>

#include "podbridge/bluetooth/device.hpp"
#include "podbridge/bluetooth/device_filter.hpp"
#include "podbridge/util/logging.hpp"

namespace podbridge::bluetooth {

namespace {

using SvMatch = std::match_results<std::string_view::const_iterator>;

constexpr char kEscape = '\x1b';

// Colour codes that lost their ESC byte somewhere along the pipe.
const std::regex& stray_colour_pattern() {
    static const std::regex kPattern(R"(\[[0-9]{1,2}(?:;[0-9]{1,2})*m|\[m)");
    return kPattern;
}

const std::regex& prompt_pattern() {
    static const std::regex kPattern(R"(^(?:\s*\[[^\]]*\][#>]\s*)+)");
    return kPattern;
}

const std::regex& device_line_pattern() {
    static const std::regex kPattern(
        R"(^(?:\[(NEW|CHG|DEL)\]\s+)?Device\s+([0-9A-Fa-f]{2}(?::[0-9A-Fa-f]{2}){5})(?:\s+(.*))?$)");
    return kPattern;
}

std::optional<bool> yes_no_field(std::string_view text, const std::regex& pattern) {
    SvMatch match;
    if (!std::regex_search(text.begin(), text.end(), match, pattern)) {
        return std::nullopt;
    }
    const auto value = match[1].str();
    return std::tolower(static_cast<unsigned char>(value.front())) == 'y';
}

}  // namespace

std::string OutputParser::strip_ansi(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == kEscape) {
            if (i + 1 >= text.size()) {
                break;
            }
            const char kind = text[i + 1];
            if (kind == '[') {
                // CSI: parameters then a final byte in 0x40..0x7e.
                i += 2;
                while (i < text.size() && !(text[i] >= 0x40 && text[i] <= 0x7e)) {
                    ++i;
                }
            } else if (kind == ']') {
                // OSC: terminated by BEL or ST.
                i += 2;
                while (i < text.size() && text[i] != '\a' &&
                       !(text[i] == kEscape && i + 1 < text.size() && text[i + 1] == '\\')) {
                    ++i;
                }
                if (i < text.size() && text[i] == kEscape) {
                    ++i;
                }
            } else {
                ++i;
            }
            continue;
        }
        if (ch == '\r' || ch == '\x01' || ch == '\x02') {
            continue;
        }
        out.push_back(ch);
    }

    return std::regex_replace(out, stray_colour_pattern(), "");
}

std::optional<OutputEvent> OutputParser::parse_line(std::string_view raw_line) {
    auto line = strip_ansi(raw_line);
    line = std::regex_replace(line, prompt_pattern(), "", std::regex_constants::format_first_only);

    std::size_t start = 0;
    while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start]))) {
        ++start;
    }
    std::string_view text(line);
    text.remove_prefix(start);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    SvMatch match;
    if (!std::regex_match(text.begin(), text.end(), match, device_line_pattern())) {
        if (text.find("Failed to connect") != std::string_view::npos) {
            return ConnectionFailure{};
        }
        return std::nullopt;
    }

    const auto tag = match[1].str();
    auto mac = normalize_mac(match[2].str());
    if (!mac) {
        return std::nullopt;
    }
    std::string rest = match[3].matched ? match[3].str() : std::string{};

    if (tag == "DEL") {
        return DeviceLost{*mac};
    }

    static const std::regex kConnected(R"(^Connected:\s*(yes|no)\b)", std::regex::icase);
    const auto connected = yes_no_field(rest, kConnected);
    if (tag == "CHG") {
        if (connected) {
            return ConnectionChange{*mac, *connected};
        }
        // Property changes carry no name; only advertisement fields count as sightings.
        static const std::regex kSighting(R"(^(RSSI|TxPower|ManufacturerData\.(Key|Value)):)",
                                          std::regex::icase);
        if (!std::regex_search(rest, kSighting)) {
            return std::nullopt;
        }
    } else if (connected) {
        return std::nullopt;
    } else if (tag.empty()) {
        // Header and error lines of `info`, not names.
        static const std::regex kInfoLine(R"(^(\((public|random)\)|not available)$)", std::regex::icase);
        if (std::regex_search(rest, kInfoLine)) {
            return std::nullopt;
        }
    }

    return DeviceAnnouncement{*mac, std::move(rest)};
}

std::vector<OutputEvent> OutputParser::feed(std::string_view chunk) {
    std::vector<OutputEvent> events;
    pending_.append(chunk.data(), chunk.size());

    std::size_t line_start = 0;
    for (auto newline = pending_.find('\n'); newline != std::string::npos;
         newline = pending_.find('\n', line_start)) {
        auto event = parse_line(std::string_view(pending_).substr(line_start, newline - line_start));
        if (event) {
            events.push_back(std::move(*event));
        }
        line_start = newline + 1;
    }
    pending_.erase(0, line_start);

    if (pending_.size() > kMaxPendingBytes) {
        util::log::warn("[bluetoothctl] Discarding " + std::to_string(pending_.size()) +
                        " bytes of unterminated output");
        pending_.clear();
    }
    return events;
}

std::vector<OutputEvent> OutputParser::flush() {
    std::vector<OutputEvent> events;
    if (!pending_.empty()) {
        if (auto event = parse_line(pending_)) {
            events.push_back(std::move(*event));
        }
        pending_.clear();
    }
    return events;
}

void OutputParser::reset() {
    pending_.clear();
}

DeviceInfo parse_device_info(std::string_view output) {
    static const std::regex kConnected(R"(Connected:\s*(yes|no))", std::regex::icase);
    static const std::regex kPaired(R"(Paired:\s*(yes|no))", std::regex::icase);
    static const std::regex kTrusted(R"(Trusted:\s*(yes|no))", std::regex::icase);

    const auto clean = OutputParser::strip_ansi(output);
    DeviceInfo info;
    info.connected = yes_no_field(clean, kConnected);
    info.paired = yes_no_field(clean, kPaired);
    info.trusted = yes_no_field(clean, kTrusted);
    info.rssi = extract_rssi(clean);
    info.battery = parse_battery(clean);
    return info;
}

std::optional<bool> parse_powered(std::string_view output) {
    static const std::regex kPowered(R"(Powered:\s*(yes|no))", std::regex::icase);
    return yes_no_field(OutputParser::strip_ansi(output), kPowered);
}

std::optional<int> parse_battery(std::string_view output) {
    static const std::regex kBattery(R"(Battery Percentage:\s*0x[0-9a-fA-F]+\s*\((\d+)\))", std::regex::icase);
    SvMatch match;
    if (!std::regex_search(output.begin(), output.end(), match, kBattery)) {
        return std::nullopt;
    }
    const auto digits = match[1].str();
    if (digits.size() > 3) {
        return std::nullopt;
    }
    const int battery = std::stoi(digits);
    if (battery < 0 || battery > 100) {
        return std::nullopt;
    }
    return battery;
}

std::size_t complete_utf8_prefix(std::string_view bytes) {
    const std::size_t size = bytes.size();
    for (std::size_t back = 1; back <= 4 && back <= size; ++back) {
        const auto byte = static_cast<unsigned char>(bytes[size - back]);
        if ((byte & 0xC0) == 0x80) {
            continue;
        }
        std::size_t expected = 1;
        if ((byte & 0xE0) == 0xC0) {
            expected = 2;
        } else if ((byte & 0xF0) == 0xE0) {
            expected = 3;
        } else if ((byte & 0xF8) == 0xF0) {
            expected = 4;
        }
        return back < expected ? size - back : size;
    }
    return size;
}

}  // namespace podbridge::bluetooth
