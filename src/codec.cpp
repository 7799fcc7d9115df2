#include "rpcwire/codec.hpp"
#include "rpcwire/version.hpp"
#include <simdjson.h>
#include <string>

namespace rpcwire {

namespace {

Json simdjson_number_to_json(simdjson::ondemand::number num) {
    switch (num.get_number_type()) {
        case simdjson::ondemand::number_type::signed_integer:
            return Json(num.get_int64());
        case simdjson::ondemand::number_type::unsigned_integer:
            return Json(num.get_uint64());
        default:
            return Json(num.get_double());
    }
}

// Convert simdjson value to Json recursively
Json simdjson_to_json(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            Json obj = Json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_json(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            Json arr = Json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_json(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return Json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            return simdjson_number_to_json(val.get_number());
        case simdjson::ondemand::json_type::boolean:
            return Json(bool(val.get_bool()));
        case simdjson::ondemand::json_type::null:
        default:
            return Json(nullptr);
    }
}

// Scalar documents cannot be viewed as a value, so the root is handled apart.
Json simdjson_doc_to_json(simdjson::ondemand::document& doc) {
    switch (doc.type()) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array:
            return simdjson_to_json(doc.get_value());
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return Json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number:
            return simdjson_number_to_json(doc.get_number());
        case simdjson::ondemand::json_type::boolean:
            return Json(bool(doc.get_bool()));
        case simdjson::ondemand::json_type::null: {
            bool is_null = doc.is_null();
            if (!is_null) {
                throw SerializationError("JSON parse error: unrecognized literal");
            }
            return Json(nullptr);
        }
        default:
            throw SerializationError("JSON parse error: unrecognized value");
    }
}

std::string_view trim_right(std::string_view s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' ||
                          s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

} // anonymous namespace

std::string Codec::serialize(const JsonRpcRequest& req) {
    try {
        Json j;
        to_json(j, req);
        return j.dump();
    } catch (const nlohmann::json::exception& e) {
        throw SerializationError(std::string("JSON encode error: ") + e.what());
    }
}

Json Codec::parse_body(std::string_view body) {
    body = trim_right(body);
    if (body.empty()) {
        throw SerializationError("Empty response body");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(body.data(), body.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw SerializationError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    Json j;
    try {
        j = simdjson_doc_to_json(doc);
    } catch (const simdjson::simdjson_error& e) {
        throw SerializationError(std::string("JSON parse error: ") + e.what());
    }
    if (!doc.at_end()) {
        throw SerializationError("JSON parse error: trailing content after document");
    }
    return j;
}

JsonRpcResponse Codec::to_response(const Json& value) {
    if (!value.is_object()) {
        throw SerializationError("Response must be a JSON object");
    }
    if (!value.contains("result") && !value.contains("error")) {
        throw SerializationError("Response has neither 'result' nor 'error'");
    }
    // "id": null is a valid reply to an unparseable request; a missing id is not.
    if (!value.contains("id")) {
        throw SerializationError("Response has no 'id'");
    }
    try {
        return value.get<JsonRpcResponse>();
    } catch (const std::exception& e) {
        throw SerializationError(std::string("Malformed response: ") + e.what());
    }
}

JsonRpcRequest Codec::parse_request(std::string_view raw) {
    Json j = parse_body(raw);
    if (!j.is_object()) {
        throw SerializationError("Request must be a JSON object");
    }
    if (!j.contains("jsonrpc") || !j.at("jsonrpc").is_string() ||
        j.at("jsonrpc").get<std::string>() != JSONRPC_VERSION) {
        throw SerializationError("Invalid jsonrpc version, expected '2.0'");
    }
    if (!j.contains("method") || !j.at("method").is_string() || !j.contains("id")) {
        throw SerializationError("Request needs a string 'method' and an 'id'");
    }
    try {
        RequestId id;
        from_json(j.at("id"), id);
        Json params = j.contains("params") ? j.at("params") : Json();
        return JsonRpcRequest(j.at("method").get<std::string>(), std::move(params), std::move(id));
    } catch (const std::exception& e) {
        throw SerializationError(std::string("Malformed request: ") + e.what());
    }
}

} // namespace rpcwire
