#include "extension_normalizer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace switchyard {

namespace {

constexpr std::string_view kExtmapPrefix = "a=extmap:";

constexpr std::array<std::pair<std::string_view, int>, 8> kCanonicalIds = {{
    {kAudioLevelUri, 1},
    {kAbsSendTimeUri, 2},
    {kTransportCcUri, 3},
    {kSdesMidUri, 4},
    {kSdesRtpStreamIdUri, 10},
    {kSdesRepairedRtpStreamIdUri, 11},
    {kVideoOrientationUri, 13},
    {kTimeOffsetUri, 14},
}};

// "a=extmap:<id>[/<direction>] <uri>[ <attributes>]" without its line ending
std::string NormalizeExtmapLine(std::string_view line) {
    auto body = line.substr(kExtmapPrefix.size());

    size_t idEnd = 0;
    while (idEnd < body.size() && std::isdigit(static_cast<unsigned char>(body[idEnd]))) {
        ++idEnd;
    }
    if (idEnd == 0) {
        return std::string(line);
    }

    auto uriBegin = body.find(' ', idEnd);
    if (uriBegin == std::string_view::npos) {
        return std::string(line);
    }
    ++uriBegin;
    auto uriEnd = body.find(' ', uriBegin);
    auto uri = body.substr(uriBegin, uriEnd == std::string_view::npos ? std::string_view::npos : uriEnd - uriBegin);

    auto canonical = CanonicalExtensionId(uri);
    if (!canonical) {
        return std::string(line);
    }

    std::string result(kExtmapPrefix);
    result += std::to_string(*canonical);
    result += body.substr(idEnd);
    return result;
}

} // namespace

std::optional<int> CanonicalExtensionId(std::string_view uri) {
    for (const auto& [known, id] : kCanonicalIds) {
        if (known == uri) {
            return id;
        }
    }
    return std::nullopt;
}

std::string NormalizeExtensions(const std::string& sdp) {
    if (sdp.find(kExtmapPrefix) == std::string::npos) {
        return sdp;
    }

    std::string result;
    result.reserve(sdp.size());

    size_t pos = 0;
    while (pos < sdp.size()) {
        auto newline = sdp.find('\n', pos);
        auto lineEnd = newline == std::string::npos ? sdp.size() : newline;
        auto contentEnd = lineEnd;
        if (contentEnd > pos && sdp[contentEnd - 1] == '\r') {
            --contentEnd;
        }

        std::string_view line(sdp.data() + pos, contentEnd - pos);
        if (line.compare(0, kExtmapPrefix.size(), kExtmapPrefix) == 0) {
            result += NormalizeExtmapLine(line);
        } else {
            result += line;
        }

        // Keep the line terminator ("\r\n", "\n" or none)
        result.append(sdp, contentEnd, (newline == std::string::npos ? sdp.size() : newline + 1) - contentEnd);
        pos = newline == std::string::npos ? sdp.size() : newline + 1;
    }

    return result;
}

} // namespace switchyard
