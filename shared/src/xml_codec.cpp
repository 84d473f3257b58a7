#include "s3up/xml_codec.hpp"

#include <charconv>
#include <climits>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <libxml/parser.h>
#include <libxml/tree.h>

#include "s3up/errors.hpp"

namespace s3up::xml
{

    namespace
    {

        struct DocumentDeleter
        {
            void operator()(xmlDoc *doc) const noexcept { xmlFreeDoc(doc); }
        };

        using Document = std::unique_ptr<xmlDoc, DocumentDeleter>;

        const xmlChar *to_xml(const char *text)
        {
            return reinterpret_cast<const xmlChar *>(text);
        }

        void ensure_parser_initialized()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           { xmlInitParser(); });
        }

        Document parse(std::string_view text)
        {
            ensure_parser_initialized();
            if (text.empty() || text.size() > static_cast<std::size_t>(INT_MAX))
            {
                throw ResponseDecodeError("Empty or oversized XML document");
            }
            xmlDoc *doc = xmlReadMemory(text.data(), static_cast<int>(text.size()), "response.xml", nullptr,
                                        XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
            if (doc == nullptr)
            {
                throw ResponseDecodeError("Malformed XML document");
            }
            return Document(doc);
        }

        bool has_name(const xmlNode *node, std::string_view name)
        {
            return node->type == XML_ELEMENT_NODE && node->name != nullptr &&
                   std::string_view(reinterpret_cast<const char *>(node->name)) == name;
        }

        const xmlNode *root_element(const Document &doc, std::string_view expected)
        {
            const xmlNode *root = xmlDocGetRootElement(doc.get());
            if (root == nullptr || !has_name(root, expected))
            {
                throw ResponseDecodeError("Unexpected XML document, expected <" + std::string(expected) + ">");
            }
            return root;
        }

        const xmlNode *first_child(const xmlNode *parent, std::string_view name)
        {
            for (const xmlNode *node = parent->children; node != nullptr; node = node->next)
            {
                if (has_name(node, name))
                {
                    return node;
                }
            }
            return nullptr;
        }

        std::vector<const xmlNode *> children_named(const xmlNode *parent, std::string_view name)
        {
            std::vector<const xmlNode *> result;
            for (const xmlNode *node = parent->children; node != nullptr; node = node->next)
            {
                if (has_name(node, name))
                {
                    result.push_back(node);
                }
            }
            return result;
        }

        std::string text_of(const xmlNode *node)
        {
            xmlChar *content = xmlNodeGetContent(node);
            if (content == nullptr)
            {
                return {};
            }
            std::string result(reinterpret_cast<const char *>(content));
            xmlFree(content);
            return result;
        }

        std::optional<std::string> child_text(const xmlNode *parent, std::string_view name)
        {
            const auto *node = first_child(parent, name);
            if (node == nullptr)
            {
                return std::nullopt;
            }
            return text_of(node);
        }

        std::string required_text(const xmlNode *parent, std::string_view name)
        {
            auto value = child_text(parent, name);
            if (!value || value->empty())
            {
                throw ResponseDecodeError("Missing <" + std::string(name) + "> element");
            }
            return *value;
        }

        template <typename Number>
        Number parse_number(std::string_view text, std::string_view field)
        {
            Number value{};
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                throw ResponseDecodeError("Invalid number in <" + std::string(field) + ">: " + std::string(text));
            }
            return value;
        }

        bool truncated(const xmlNode *root)
        {
            return child_text(root, "IsTruncated").value_or("false") == "true";
        }

    } // namespace

    std::string decode_initiate_result(std::string_view document)
    {
        const auto doc = parse(document);
        const auto *root = root_element(doc, "InitiateMultipartUploadResult");
        return required_text(root, "UploadId");
    }

    ListPartsPage decode_list_parts(std::string_view document)
    {
        const auto doc = parse(document);
        const auto *root = root_element(doc, "ListPartsResult");

        ListPartsPage page;
        for (const auto *node : children_named(root, "Part"))
        {
            page.parts.push_back(CompletedPart{
                .part_number = parse_number<std::uint32_t>(required_text(node, "PartNumber"), "PartNumber"),
                .etag = required_text(node, "ETag"),
            });
        }
        page.is_truncated = truncated(root);
        if (const auto marker = child_text(root, "NextPartNumberMarker"); marker && !marker->empty())
        {
            page.next_part_number_marker = parse_number<std::uint32_t>(*marker, "NextPartNumberMarker");
        }
        return page;
    }

    ListObjectsPage decode_list_objects(std::string_view document)
    {
        const auto doc = parse(document);
        const auto *root = root_element(doc, "ListBucketResult");

        ListObjectsPage page;
        for (const auto *node : children_named(root, "Contents"))
        {
            ObjectInfo object;
            object.key = required_text(node, "Key");
            object.size = parse_number<std::uint64_t>(child_text(node, "Size").value_or("0"), "Size");
            const auto modified_text = required_text(node, "LastModified");
            const auto modified = parse_iso8601(modified_text);
            if (!modified)
            {
                throw ResponseDecodeError("Invalid <LastModified>: " + modified_text);
            }
            object.last_modified = *modified;
            if (auto etag = child_text(node, "ETag"); etag && !etag->empty())
            {
                object.etag = std::move(*etag);
            }
            page.objects.push_back(std::move(object));
        }
        page.is_truncated = truncated(root);
        if (auto token = child_text(root, "NextContinuationToken"); token && !token->empty())
        {
            page.next_continuation_token = std::move(*token);
        }
        return page;
    }

    std::optional<ServiceError> decode_error(std::string_view document) noexcept
    {
        try
        {
            const auto doc = parse(document);
            const auto *root = root_element(doc, "Error");
            return ServiceError{
                .code = child_text(root, "Code").value_or(std::string{}),
                .message = child_text(root, "Message").value_or(std::string{}),
            };
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    std::string encode_complete_request(std::span<const CompletedPart> parts)
    {
        for (std::size_t i = 1; i < parts.size(); ++i)
        {
            if (parts[i].part_number <= parts[i - 1].part_number)
            {
                throw std::invalid_argument("Completed parts must be unique and sorted by part number");
            }
        }

        ensure_parser_initialized();
        Document doc(xmlNewDoc(to_xml("1.0")));
        if (!doc)
        {
            throw std::runtime_error("xmlNewDoc failed");
        }
        xmlNode *root = xmlNewNode(nullptr, to_xml("CompleteMultipartUpload"));
        xmlDocSetRootElement(doc.get(), root);
        for (const auto &part : parts)
        {
            xmlNode *node = xmlNewChild(root, nullptr, to_xml("Part"), nullptr);
            const auto number = std::to_string(part.part_number);
            xmlNewTextChild(node, nullptr, to_xml("PartNumber"), to_xml(number.c_str()));
            xmlNewTextChild(node, nullptr, to_xml("ETag"), to_xml(part.etag.c_str()));
        }

        xmlChar *buffer = nullptr;
        int size = 0;
        xmlDocDumpMemoryEnc(doc.get(), &buffer, &size, "UTF-8");
        if (buffer == nullptr)
        {
            throw std::runtime_error("xmlDocDumpMemoryEnc failed");
        }
        std::string result(reinterpret_cast<const char *>(buffer), static_cast<std::size_t>(size));
        xmlFree(buffer);
        return result;
    }

    std::vector<CompletedPart> decode_complete_request(std::string_view document)
    {
        const auto doc = parse(document);
        const auto *root = root_element(doc, "CompleteMultipartUpload");
        std::vector<CompletedPart> parts;
        for (const auto *node : children_named(root, "Part"))
        {
            parts.push_back(CompletedPart{
                .part_number = parse_number<std::uint32_t>(required_text(node, "PartNumber"), "PartNumber"),
                .etag = required_text(node, "ETag"),
            });
        }
        return parts;
    }

} // namespace s3up::xml
