/**
 * LineCodec — Turns text payloads into wire frames and back.
 *
 * Frame layout: escaped payload followed by a single '\n'.
 * Terminal clients that send CRLF are accepted; the CR is not part of
 * the payload.
 */

#include "codec/line_codec.h"

std::string LineCodec::encode(std::string_view payload) {
    std::string frame;
    frame.reserve(payload.size() + 1);

    for (char c : payload) {
        switch (c) {
            case '\\': frame += "\\\\"; break;
            case '\n': frame += "\\n";  break;
            case '\r': frame += "\\r";  break;
            default:   frame += c;      break;
        }
    }
    frame += delimiter;
    return frame;
}

std::optional<std::string> LineCodec::decode(std::string_view line) {
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);

    std::string payload;
    payload.reserve(line.size());

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c != '\\') {
            payload += c;
            continue;
        }
        if (++i == line.size())
            return std::nullopt;

        switch (line[i]) {
            case '\\': payload += '\\'; break;
            case 'n':  payload += '\n'; break;
            case 'r':  payload += '\r'; break;
            default:   return std::nullopt;
        }
    }
    return payload;
}
