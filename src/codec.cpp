#include "lspc/codec.hpp"
#include "lspc/error.hpp"
#include "lspc/logging.hpp"
#include "lspc/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <charconv>
#include <string>

namespace lspc {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    auto val = doc.get_value();
    if (val.error()) {
        throw FramingError("Failed to get document value");
    }
    return simdjson_to_nlohmann(val.value());
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    if (!j.contains("jsonrpc")) {
        throw FramingError("Missing 'jsonrpc' field");
    }
    if (!j.at("jsonrpc").is_string() || j.at("jsonrpc").get<std::string>() != JSONRPC_VERSION) {
        throw FramingError("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    try {
        if (has_method && has_id) {
            if (j.at("id").is_null()) {
                throw FramingError("Request ID must not be null");
            }
            JsonRpcRequest req;
            from_json(j, req);
            return req;
        } else if (has_method && !has_id) {
            JsonRpcNotification notif;
            from_json(j, notif);
            return notif;
        } else if (has_id && !has_method) {
            if (j.at("id").is_null()) {
                throw FramingError("Response ID must not be null");
            }
            bool has_result = j.contains("result");
            bool has_error = j.contains("error");
            if (has_result == has_error) {
                throw FramingError("Response must carry exactly one of 'result' or 'error'");
            }
            JsonRpcResponse resp;
            from_json(j, resp);
            return resp;
        }
    } catch (const nlohmann::json::exception& e) {
        throw FramingError(std::string("Malformed message: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw FramingError(std::string("Malformed message: ") + e.what());
    }
    throw FramingError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw FramingError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw FramingError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const simdjson::simdjson_error& e) {
        throw FramingError(std::string("JSON parse error: ") + e.what());
    }
    if (!doc.at_end()) {
        throw FramingError("Trailing content after JSON value");
    }

    if (!j.is_object()) {
        throw FramingError("Message must be a JSON object");
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

std::string Codec::encode_frame(const JsonRpcMessage& msg) {
    return encode_frame(serialize(msg));
}

std::string Codec::encode_frame(std::string_view body) {
    std::string frame;
    frame.reserve(body.size() + 32);
    frame.append(CONTENT_LENGTH_HEADER);
    frame.push_back(' ');
    frame.append(std::to_string(body.size()));
    frame.append("\r\n\r\n");
    frame.append(body);
    return frame;
}

// ---------- FrameDecoder ----------

void FrameDecoder::feed(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
}

std::optional<std::string> FrameDecoder::next() {
    while (!body_length_) {
        size_t nl = buffer_.find('\n', pos_);
        if (nl == std::string::npos) {
            compact();
            return std::nullopt;
        }

        std::string_view line(buffer_.data() + pos_, nl - pos_);
        pos_ = nl + 1;
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (line.empty()) {
            auto length = header_length_;
            std::string invalid = std::move(invalid_length_);
            header_length_.reset();
            invalid_length_.clear();
            if (!length) {
                compact();
                if (!invalid.empty()) {
                    throw FramingError("Invalid Content-Length value '" + invalid + "'");
                }
                throw FramingError("Header block without Content-Length");
            }
            body_length_ = length;
            break;
        }

        if (line.substr(0, CONTENT_LENGTH_HEADER.size()) != CONTENT_LENGTH_HEADER) {
            continue; // Content-Type and anything else
        }

        std::string_view value = trim(line.substr(CONTENT_LENGTH_HEADER.size()));
        size_t n = 0;
        auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
        if (ec != std::errc() || end != value.data() + value.size() || n == 0) {
            invalid_length_ = std::string(value);
            logger()->debug("Ignoring invalid Content-Length value '{}'", invalid_length_);
            continue;
        }
        header_length_ = n;
    }

    if (buffer_.size() - pos_ < *body_length_) {
        compact();
        return std::nullopt;
    }

    std::string body = buffer_.substr(pos_, *body_length_);
    pos_ += *body_length_;
    body_length_.reset();
    return body;
}

size_t FrameDecoder::buffered() const {
    return buffer_.size() - pos_;
}

void FrameDecoder::compact() {
    if (pos_ > 0) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
}

} // namespace lspc
