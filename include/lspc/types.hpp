#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lspc {

// ---------- Documents and positions ----------

/// Zero-based line and UTF-16 character offset.
struct Position {
    int line = 0;
    int character = 0;

    bool operator==(const Position& o) const {
        return line == o.line && character == o.character;
    }
};

struct TextDocumentIdentifier {
    std::string uri;

    bool operator==(const TextDocumentIdentifier& o) const { return uri == o.uri; }
};

struct VersionedTextDocumentIdentifier {
    std::string uri;
    int version = 0;

    bool operator==(const VersionedTextDocumentIdentifier& o) const {
        return uri == o.uri && version == o.version;
    }
};

struct TextDocumentItem {
    std::string uri;
    std::string language_id;
    int version = 1;
    std::string text;

    bool operator==(const TextDocumentItem& o) const {
        return uri == o.uri && language_id == o.language_id
               && version == o.version && text == o.text;
    }
};

/// A change event without a range: the whole document is replaced.
struct TextDocumentContentChangeEvent {
    std::string text;

    bool operator==(const TextDocumentContentChangeEvent& o) const {
        return text == o.text;
    }
};

// ---------- Request / notification params ----------

struct InitializeParams {
    // processId is always sent as null.
    std::optional<std::string> root_uri;
    nlohmann::json capabilities = nlohmann::json::object();

    bool operator==(const InitializeParams& o) const {
        return root_uri == o.root_uri && capabilities == o.capabilities;
    }
};

struct DidOpenTextDocumentParams {
    TextDocumentItem text_document;

    bool operator==(const DidOpenTextDocumentParams& o) const {
        return text_document == o.text_document;
    }
};

struct DidChangeTextDocumentParams {
    VersionedTextDocumentIdentifier text_document;
    std::vector<TextDocumentContentChangeEvent> content_changes;

    bool operator==(const DidChangeTextDocumentParams& o) const {
        return text_document == o.text_document && content_changes == o.content_changes;
    }
};

/// Shared by textDocument/completion and textDocument/hover.
struct TextDocumentPositionParams {
    TextDocumentIdentifier text_document;
    Position position;

    bool operator==(const TextDocumentPositionParams& o) const {
        return text_document == o.text_document && position == o.position;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t);
void from_json(const nlohmann::json& j, TextDocumentIdentifier& t);

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& t);
void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& t);

void to_json(nlohmann::json& j, const TextDocumentItem& t);
void from_json(const nlohmann::json& j, TextDocumentItem& t);

void to_json(nlohmann::json& j, const TextDocumentContentChangeEvent& c);
void from_json(const nlohmann::json& j, TextDocumentContentChangeEvent& c);

void to_json(nlohmann::json& j, const InitializeParams& p);
void from_json(const nlohmann::json& j, InitializeParams& p);

void to_json(nlohmann::json& j, const DidOpenTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidOpenTextDocumentParams& p);

void to_json(nlohmann::json& j, const DidChangeTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidChangeTextDocumentParams& p);

void to_json(nlohmann::json& j, const TextDocumentPositionParams& p);
void from_json(const nlohmann::json& j, TextDocumentPositionParams& p);

} // namespace lspc
