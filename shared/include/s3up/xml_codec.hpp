/**
 * s3up - Typed decoding and encoding of the S3 XML payloads.
 */
#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "s3up/s3_types.hpp"

namespace s3up::xml
{

    // All decoders throw ResponseDecodeError on malformed documents or when
    // a field the protocol requires is absent.

    std::string decode_initiate_result(std::string_view document);

    ListPartsPage decode_list_parts(std::string_view document);

    ListObjectsPage decode_list_objects(std::string_view document);

    // Never throws; an empty or non-XML error body yields nullopt.
    std::optional<ServiceError> decode_error(std::string_view document) noexcept;

    // Parts must be strictly ascending by part number; throws
    // std::invalid_argument otherwise.
    std::string encode_complete_request(std::span<const CompletedPart> parts);

    std::vector<CompletedPart> decode_complete_request(std::string_view document);

} // namespace s3up::xml
