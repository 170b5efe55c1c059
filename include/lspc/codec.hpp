#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace lspc {

constexpr std::string_view CONTENT_LENGTH_HEADER = "Content-Length:";

class Codec {
public:
    /// Parse one JSON body into a message.
    /// Throws FramingError on invalid JSON or missing required fields.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to its JSON body.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Serialize a message and prepend the Content-Length header block.
    [[nodiscard]] static std::string encode_frame(const JsonRpcMessage& msg);

    /// Wrap an already serialized body in a frame.
    [[nodiscard]] static std::string encode_frame(std::string_view body);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

/// Incremental decoder for Content-Length framed input.
///
/// Bytes are appended with feed() as they arrive from the transport and
/// complete bodies are taken out with next(). Header lines are consumed one
/// at a time up to the blank line; the body is then exactly Content-Length
/// bytes, whatever those bytes contain.
class FrameDecoder {
public:
    void feed(std::string_view bytes);

    /// Next complete body, or std::nullopt if more input is needed.
    /// Throws FramingError after consuming a header block that carried no
    /// usable Content-Length; the decoder stays usable afterwards.
    [[nodiscard]] std::optional<std::string> next();

    /// Bytes received but not yet consumed.
    [[nodiscard]] size_t buffered() const;

private:
    void compact();

    std::string buffer_;
    size_t pos_ = 0;
    std::optional<size_t> header_length_;   // seen in the current header block
    std::string invalid_length_;            // last unparseable value, for the error
    std::optional<size_t> body_length_;     // header block done, waiting for body
};

} // namespace lspc
