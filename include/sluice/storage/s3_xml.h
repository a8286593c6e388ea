#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <sluice/storage/destination_writer.h>

namespace sluice::storage {

// Text of the first <tag>...</tag> element in body, XML entities decoded
std::optional<std::string> extractXmlTag(std::string_view body, std::string_view tag);

std::string xmlEscape(std::string_view text);

// CompleteMultipartUpload request body for parts (already ordered by index)
std::string buildCompleteMultipartBody(const std::vector<PartInfo>& parts);

struct ListPartsPage {
    std::vector<PartInfo> parts;
    bool truncated{false};
    std::string nextMarker;
};

ListPartsPage parseListPartsResult(std::string_view body);

} // namespace sluice::storage
