#ifndef SYNAPSE_UTILS_TERMINAL_HPP
#define SYNAPSE_UTILS_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Synapse::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset         = "\033[0m";
        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";
        inline constexpr std::string_view kBrightMagenta = "\033[95m";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Plain text when colouring is off (log files, captured streams).
    inline std::string Paint(std::string_view s, std::string_view color, bool enabled) {
        return enabled ? ApplyColor(s, color) : std::string(s);
    }
}

#endif // SYNAPSE_UTILS_TERMINAL_HPP
