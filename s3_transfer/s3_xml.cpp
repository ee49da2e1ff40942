#include "s3_xml.hpp"

// stdlib includes
#include <memory>
#include <stdexcept>

// other includes
#include <fmt/format.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>

namespace s3_cli::io::s3_transfer
{

    namespace
    {
        struct xml_doc_deleter
        {
            void operator()(xmlDoc* _doc) const { xmlFreeDoc(_doc); }
        };

        struct xpath_context_deleter
        {
            void operator()(xmlXPathContext* _ctx) const { xmlXPathFreeContext(_ctx); }
        };

        struct xpath_object_deleter
        {
            void operator()(xmlXPathObject* _obj) const { xmlXPathFreeObject(_obj); }
        };

        using xml_doc_ptr       = std::unique_ptr<xmlDoc, xml_doc_deleter>;
        using xpath_context_ptr = std::unique_ptr<xmlXPathContext, xpath_context_deleter>;
        using xpath_object_ptr  = std::unique_ptr<xmlXPathObject, xpath_object_deleter>;

        // S3 responses carry a default namespace, so lookups go by local-name()
        // and the documents are parsed without network access or noise on stderr.
        class xml_document
        {
        public:

            explicit xml_document(const std::string& _body)
                : initialized_{initialize_parser()}
                , doc_{_body.empty() ? nullptr
                       : xmlReadMemory(_body.data(), static_cast<int>(_body.size()), "s3.xml", nullptr,
                                       XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING)}
                , ctx_{doc_ ? xmlXPathNewContext(doc_.get()) : nullptr}
            {}

            bool valid() const { return doc_ && ctx_; }

            auto root_name() const -> std::string
            {
                xmlNode* root = xmlDocGetRootElement(doc_.get());
                return root ? reinterpret_cast<const char*>(root->name) : "";
            }

            auto nodes(const std::string& _xpath, xmlNode* _context_node = nullptr) const -> std::vector<xmlNode*>
            {
                std::vector<xmlNode*> result;
                ctx_->node = _context_node ? _context_node : xmlDocGetRootElement(doc_.get());
                xpath_object_ptr obj{xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(_xpath.c_str()), ctx_.get())};
                if (obj && obj->nodesetval) {
                    for (int i = 0; i < obj->nodesetval->nodeNr; ++i) {
                        result.push_back(obj->nodesetval->nodeTab[i]);
                    }
                }
                return result;
            }

            auto text(const std::string& _xpath, xmlNode* _context_node = nullptr) const -> std::optional<std::string>
            {
                auto found = nodes(_xpath, _context_node);
                if (found.empty()) {
                    return std::nullopt;
                }
                xmlChar* content = xmlNodeGetContent(found.front());
                std::string value = content ? reinterpret_cast<const char*>(content) : "";
                xmlFree(content);
                return value;
            }

        private:

            static bool initialize_parser()
            {
                // libxml2 must be initialized once before it is used from several threads
                static const bool initialized = (xmlInitParser(), true);
                return initialized;
            }

            bool              initialized_;
            xml_doc_ptr       doc_;
            xpath_context_ptr ctx_;
        };

        auto child(const std::string& _name) -> std::string
        {
            return fmt::format("./*[local-name()='{}']", _name);
        }

        auto escape_xml(const std::string& _value) -> std::string
        {
            std::string escaped;
            escaped.reserve(_value.size());
            for (char c : _value) {
                switch (c) {
                    case '&':  escaped += "&amp;";  break;
                    case '<':  escaped += "&lt;";   break;
                    case '>':  escaped += "&gt;";   break;
                    case '"':  escaped += "&quot;"; break;
                    case '\'': escaped += "&apos;"; break;
                    default:   escaped += c;
                }
            }
            return escaped;
        }
    } // anonymous namespace

    auto parse_error(const std::string& _body) -> std::optional<s3_error_details>
    {
        xml_document doc{_body};
        if (!doc.valid() || doc.root_name() != "Error") {
            return std::nullopt;
        }

        s3_error_details details;
        details.code       = doc.text(child("Code")).value_or("");
        details.message    = doc.text(child("Message")).value_or("");
        details.resource   = doc.text(child("Resource")).value_or("");
        details.request_id = doc.text(child("RequestId")).value_or("");
        return details;
    }

    auto parse_upload_id(const std::string& _body) -> std::optional<std::string>
    {
        xml_document doc{_body};
        if (!doc.valid()) {
            return std::nullopt;
        }

        auto upload_id = doc.text(child("UploadId"));
        if (!upload_id || upload_id->empty()) {
            return std::nullopt;
        }
        return upload_id;
    }

    auto parse_list_objects(const std::string& _body) -> std::optional<list_objects_page>
    {
        xml_document doc{_body};
        if (!doc.valid() || doc.root_name() != "ListBucketResult") {
            return std::nullopt;
        }

        list_objects_page page;
        page.is_truncated            = doc.text(child("IsTruncated")).value_or("false") == "true";
        page.next_continuation_token = doc.text(child("NextContinuationToken")).value_or("");

        for (xmlNode* contents : doc.nodes(child("Contents"))) {
            object_summary summary;
            summary.key           = doc.text(child("Key"), contents).value_or("");
            summary.last_modified = doc.text(child("LastModified"), contents).value_or("");
            summary.etag          = doc.text(child("ETag"), contents).value_or("");
            try {
                summary.size      = std::stoull(doc.text(child("Size"), contents).value_or("0"));
            } catch (const std::logic_error&) {
                return std::nullopt;
            }
            page.objects.push_back(std::move(summary));
        }

        return page;
    }

    auto build_complete_multipart_upload_xml(const std::vector<std::pair<int, std::string>>& _parts) -> std::string
    {
        auto xml = fmt::format("<CompleteMultipartUpload>\n");
        for (const auto& [part_number, etag] : _parts) {
            xml += fmt::format("<Part><PartNumber>{}</PartNumber><ETag>{}</ETag></Part>\n",
                    part_number, escape_xml(etag));
        }
        xml += fmt::format("</CompleteMultipartUpload>\n");
        return xml;
    }

} // s3_cli::io::s3_transfer
