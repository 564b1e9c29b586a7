#include "../../include/notifications/prowl_response.hpp"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <sstream>

namespace prowl {

namespace pt = boost::property_tree;

bool decodeProwlResponse(const std::string& body, ProwlResponse* out_response, ProwlError* out_error) {
    if (body.empty()) {
        return fail(out_error, ProwlErrorKind::DECODE, "empty response body");
    }

    pt::ptree root;
    try {
        std::istringstream ss(body);
        pt::read_xml(ss, root, pt::xml_parser::trim_whitespace);
    } catch (const pt::xml_parser_error& e) {
        return fail(out_error, ProwlErrorKind::DECODE,
                    std::string("can't unmarshal xml response from prowl server: ") + e.what());
    }

    auto prowlOpt = root.get_child_optional("prowl");
    if (!prowlOpt) {
        return fail(out_error, ProwlErrorKind::DECODE, "response has no <prowl> root element");
    }

    ProwlResponse response;

    auto errorOpt = prowlOpt->get_child_optional("error");
    if (errorOpt) {
        auto code = errorOpt->get_optional<int>("<xmlattr>.code");
        if (!code) {
            return fail(out_error, ProwlErrorKind::DECODE, "error element without numeric code");
        }
        response.has_error = true;
        response.error_code = *code;
        response.error_message = errorOpt->get_value<std::string>("");
    }

    auto successOpt = prowlOpt->get_child_optional("success");
    if (successOpt) {
        auto code = successOpt->get_optional<int>("<xmlattr>.code");
        auto remaining = successOpt->get_optional<int>("<xmlattr>.remaining");
        auto reset = successOpt->get_optional<int64_t>("<xmlattr>.resetdate");
        if (!code || !remaining || !reset) {
            return fail(out_error, ProwlErrorKind::DECODE,
                        "success element needs numeric code, remaining and resetdate");
        }
        response.has_success = true;
        response.success_code = *code;
        response.remaining = *remaining;
        response.reset_date = *reset;
    }

    auto retrieveOpt = prowlOpt->get_child_optional("retrieve");
    if (retrieveOpt) {
        response.has_retrieve = true;
        response.retrieve_api_key = retrieveOpt->get<std::string>("<xmlattr>.apikey", "");
        response.retrieve_token = retrieveOpt->get<std::string>("<xmlattr>.token", "");
        response.retrieve_url = retrieveOpt->get<std::string>("<xmlattr>.url", "");
    }

    if (out_response) *out_response = std::move(response);
    return true;
}

} // namespace prowl
