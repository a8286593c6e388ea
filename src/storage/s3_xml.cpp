#include <sluice/storage/s3_xml.h>

#include <spdlog/spdlog.h>

namespace sluice::storage {

namespace {

std::string xmlUnescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out.push_back(text[i]);
            continue;
        }
        auto semi = text.find(';', i);
        if (semi == std::string_view::npos) {
            out.push_back(text[i]);
            continue;
        }
        auto entity = text.substr(i + 1, semi - i - 1);
        if (entity == "quot") {
            out.push_back('"');
        } else if (entity == "amp") {
            out.push_back('&');
        } else if (entity == "lt") {
            out.push_back('<');
        } else if (entity == "gt") {
            out.push_back('>');
        } else if (entity == "apos") {
            out.push_back('\'');
        } else {
            out.append(text.substr(i, semi - i + 1));
        }
        i = semi;
    }
    return out;
}

// Raw (still escaped) inner text of each <tag> element, in document order
std::vector<std::string_view> elements(std::string_view body, std::string_view tag) {
    std::vector<std::string_view> out;
    const std::string open = "<" + std::string(tag) + ">";
    const std::string close = "</" + std::string(tag) + ">";
    std::size_t pos = 0;
    while ((pos = body.find(open, pos)) != std::string_view::npos) {
        auto start = pos + open.size();
        auto end = body.find(close, start);
        if (end == std::string_view::npos) {
            break;
        }
        out.push_back(body.substr(start, end - start));
        pos = end + close.size();
    }
    return out;
}

} // namespace

std::optional<std::string> extractXmlTag(std::string_view body, std::string_view tag) {
    auto found = elements(body, tag);
    if (found.empty()) {
        return std::nullopt;
    }
    return xmlUnescape(found.front());
}

std::string xmlEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string buildCompleteMultipartBody(const std::vector<PartInfo>& parts) {
    std::string body = "<CompleteMultipartUpload>";
    for (const auto& part : parts) {
        body += "<Part><PartNumber>" + std::to_string(part.index) + "</PartNumber><ETag>" +
                xmlEscape(part.etag) + "</ETag></Part>";
    }
    body += "</CompleteMultipartUpload>";
    return body;
}

ListPartsPage parseListPartsResult(std::string_view body) {
    ListPartsPage page;
    for (auto element : elements(body, "Part")) {
        auto number = extractXmlTag(element, "PartNumber");
        auto etag = extractXmlTag(element, "ETag");
        auto size = extractXmlTag(element, "Size");
        if (!number || !size) {
            spdlog::warn("ListParts: skipping malformed <Part> entry");
            continue;
        }
        try {
            PartInfo part;
            part.index = static_cast<std::uint32_t>(std::stoul(*number));
            part.size = std::stoull(*size);
            part.etag = etag.value_or("");
            page.parts.push_back(std::move(part));
        } catch (const std::exception& e) {
            spdlog::warn("ListParts: skipping <Part> with bad number: {}", e.what());
        }
    }
    page.truncated = extractXmlTag(body, "IsTruncated").value_or("false") == "true";
    page.nextMarker = extractXmlTag(body, "NextPartNumberMarker").value_or("");
    return page;
}

} // namespace sluice::storage
