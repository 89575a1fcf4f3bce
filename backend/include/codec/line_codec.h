#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * Newline-delimited text framing.
 *
 * One message is one line. Backslash, LF and CR inside the payload are
 * escaped (`\\`, `\n`, `\r`) so any text survives the trip unchanged.
 */
class LineCodec {
public:
    static constexpr char delimiter = '\n';

    /// Escape a payload and append the delimiter.
    static std::string encode(std::string_view payload);

    /// Decode one line (without its delimiter). A raw trailing CR is dropped.
    /// Returns std::nullopt on an unknown escape or a dangling backslash.
    static std::optional<std::string> decode(std::string_view line);
};
