#include <catch2/catch_test_macros.hpp>

#include <sluice/storage/s3_xml.h>

using namespace sluice::storage;

TEST_CASE("extractXmlTag decodes entities", "[storage][s3][xml]") {
    std::string body = R"(<?xml version="1.0"?>
<InitiateMultipartUploadResult><Bucket>b</Bucket><Key>a&amp;b</Key>
<UploadId>VXBsb2FkIElE</UploadId></InitiateMultipartUploadResult>)";
    CHECK(extractXmlTag(body, "UploadId") == std::optional<std::string>{"VXBsb2FkIElE"});
    CHECK(extractXmlTag(body, "Key") == std::optional<std::string>{"a&b"});
    CHECK_FALSE(extractXmlTag(body, "Missing").has_value());
}

TEST_CASE("CompleteMultipartUpload body lists parts in order", "[storage][s3][xml]") {
    std::vector<PartInfo> parts{{1, 10, "\"e1\"", ""}, {2, 5, "\"e2\"", ""}};
    CHECK(buildCompleteMultipartBody(parts) ==
          "<CompleteMultipartUpload>"
          "<Part><PartNumber>1</PartNumber><ETag>&quot;e1&quot;</ETag></Part>"
          "<Part><PartNumber>2</PartNumber><ETag>&quot;e2&quot;</ETag></Part>"
          "</CompleteMultipartUpload>");
}

TEST_CASE("ListParts result parsing with pagination", "[storage][s3][xml]") {
    std::string body = R"(<ListPartsResult>
  <Bucket>b</Bucket><Key>k</Key><UploadId>u</UploadId>
  <PartNumberMarker>0</PartNumberMarker>
  <NextPartNumberMarker>2</NextPartNumberMarker>
  <IsTruncated>true</IsTruncated>
  <Part><PartNumber>1</PartNumber><ETag>&quot;aaa&quot;</ETag><Size>5242880</Size></Part>
  <Part><PartNumber>2</PartNumber><ETag>&quot;bbb&quot;</ETag><Size>17</Size></Part>
  <Part><PartNumber>x</PartNumber><Size>1</Size></Part>
</ListPartsResult>)";
    auto page = parseListPartsResult(body);
    REQUIRE(page.parts.size() == 2);
    CHECK(page.parts[0].index == 1);
    CHECK(page.parts[0].size == 5242880);
    CHECK(page.parts[0].etag == "\"aaa\"");
    CHECK(page.parts[1].index == 2);
    CHECK(page.parts[1].size == 17);
    CHECK(page.truncated);
    CHECK(page.nextMarker == "2");

    auto last = parseListPartsResult("<ListPartsResult><IsTruncated>false</IsTruncated></ListPartsResult>");
    CHECK(last.parts.empty());
    CHECK_FALSE(last.truncated);
}
