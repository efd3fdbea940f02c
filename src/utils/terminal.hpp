#ifndef CONCORD_TERMINAL_HPP
#define CONCORD_TERMINAL_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace Concord::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kRed           = "\033[31m";
        inline constexpr std::string_view kGreen         = "\033[32m";
        inline constexpr std::string_view kYellow        = "\033[33m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightRed     = "\033[91m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";
        inline constexpr std::string_view kBrightCyan    = "\033[96m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck = "✔";
        inline constexpr std::string_view kCross = "✘";
        inline constexpr std::string_view kWarn  = "⚠";
    }

    namespace Control {
        inline constexpr std::string_view kEraseLine = "\033[2K";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Text sink used by every component. A null stream silences output.
    inline void Say(std::ostream* stream, std::string_view message) {
        if (stream == nullptr) {
            return;
        }
        (*stream) << message;
        stream->flush();
    }

    inline void Warn(std::ostream* stream, std::string_view message) {
        if (stream == nullptr) {
            return;
        }
        std::string line;
        line.append(ApplyColor(std::string("[Concord] ") + std::string(Symbols::kWarn), Colors::kBrightYellow))
            .append(" ")
            .append(message)
            .append("\n");
        Say(stream, line);
    }
}

#endif // CONCORD_TERMINAL_HPP
