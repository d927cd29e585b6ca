#pragma once

#include <optional>
#include <string_view>
#include <variant>

namespace podbridge::bluetooth {

namespace connectivity {

struct Uninitialized {};

// Process spawned, initial state refresh not finished yet.
struct Initializing {};

struct Ready {
    enum class Activity {
        Idle,
        Scanning,
    };

    bool powered{true};
    Activity activity{Activity::Idle};
};

struct Disconnected {
    std::optional<int> exit_status;
};

}  // namespace connectivity

using ConnectivityState = std::variant<connectivity::Uninitialized, connectivity::Initializing,
                                       connectivity::Ready, connectivity::Disconnected>;

// True while the control tool process is alive.
inline bool process_alive(const ConnectivityState& state) {
    return std::holds_alternative<connectivity::Initializing>(state) ||
           std::holds_alternative<connectivity::Ready>(state);
}

inline bool is_ready(const ConnectivityState& state) {
    return std::holds_alternative<connectivity::Ready>(state);
}

inline bool is_scanning(const ConnectivityState& state) {
    const auto* ready = std::get_if<connectivity::Ready>(&state);
    return ready != nullptr && ready->activity == connectivity::Ready::Activity::Scanning;
}

// Unknown before the first `show`; assumed on.
inline bool is_powered(const ConnectivityState& state) {
    const auto* ready = std::get_if<connectivity::Ready>(&state);
    return ready == nullptr || ready->powered;
}

inline std::string_view state_name(const ConnectivityState& state) {
    struct Visitor {
        std::string_view operator()(const connectivity::Uninitialized&) const { return "uninitialized"; }
        std::string_view operator()(const connectivity::Initializing&) const { return "initializing"; }
        std::string_view operator()(const connectivity::Ready& ready) const {
            return ready.activity == connectivity::Ready::Activity::Scanning ? "scanning" : "idle";
        }
        std::string_view operator()(const connectivity::Disconnected&) const { return "disconnected"; }
    };
    return std::visit(Visitor{}, state);
}

}  // namespace podbridge::bluetooth
