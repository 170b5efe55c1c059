#include "lspc/types.hpp"

namespace lspc {

// ---------- Position ----------

void to_json(nlohmann::json& j, const Position& p) {
    j = {{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
    p.line = j.at("line").get<int>();
    p.character = j.at("character").get<int>();
}

// ---------- TextDocumentIdentifier ----------

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t) {
    j = {{"uri", t.uri}};
}

void from_json(const nlohmann::json& j, TextDocumentIdentifier& t) {
    t.uri = j.at("uri").get<std::string>();
}

// ---------- VersionedTextDocumentIdentifier ----------

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& t) {
    j = {{"uri", t.uri}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& t) {
    t.uri = j.at("uri").get<std::string>();
    t.version = j.at("version").get<int>();
}

// ---------- TextDocumentItem ----------

void to_json(nlohmann::json& j, const TextDocumentItem& t) {
    j = {
        {"uri", t.uri},
        {"languageId", t.language_id},
        {"version", t.version},
        {"text", t.text}
    };
}

void from_json(const nlohmann::json& j, TextDocumentItem& t) {
    t.uri = j.at("uri").get<std::string>();
    t.language_id = j.at("languageId").get<std::string>();
    t.version = j.at("version").get<int>();
    t.text = j.at("text").get<std::string>();
}

// ---------- TextDocumentContentChangeEvent ----------

void to_json(nlohmann::json& j, const TextDocumentContentChangeEvent& c) {
    j = {{"text", c.text}};
}

void from_json(const nlohmann::json& j, TextDocumentContentChangeEvent& c) {
    c.text = j.at("text").get<std::string>();
}

// ---------- InitializeParams ----------

void to_json(nlohmann::json& j, const InitializeParams& p) {
    j = {
        {"processId", nullptr},
        {"rootUri", p.root_uri ? nlohmann::json(*p.root_uri) : nlohmann::json(nullptr)},
        {"capabilities", p.capabilities}
    };
}

void from_json(const nlohmann::json& j, InitializeParams& p) {
    if (j.contains("rootUri") && !j.at("rootUri").is_null()) {
        p.root_uri = j.at("rootUri").get<std::string>();
    }
    if (j.contains("capabilities")) p.capabilities = j.at("capabilities");
}

// ---------- DidOpenTextDocumentParams ----------

void to_json(nlohmann::json& j, const DidOpenTextDocumentParams& p) {
    j = {{"textDocument", p.text_document}};
}

void from_json(const nlohmann::json& j, DidOpenTextDocumentParams& p) {
    p.text_document = j.at("textDocument").get<TextDocumentItem>();
}

// ---------- DidChangeTextDocumentParams ----------

void to_json(nlohmann::json& j, const DidChangeTextDocumentParams& p) {
    j = {
        {"textDocument", p.text_document},
        {"contentChanges", p.content_changes}
    };
}

void from_json(const nlohmann::json& j, DidChangeTextDocumentParams& p) {
    p.text_document = j.at("textDocument").get<VersionedTextDocumentIdentifier>();
    p.content_changes = j.at("contentChanges").get<std::vector<TextDocumentContentChangeEvent>>();
}

// ---------- TextDocumentPositionParams ----------

void to_json(nlohmann::json& j, const TextDocumentPositionParams& p) {
    j = {{"textDocument", p.text_document}, {"position", p.position}};
}

void from_json(const nlohmann::json& j, TextDocumentPositionParams& p) {
    p.text_document = j.at("textDocument").get<TextDocumentIdentifier>();
    p.position = j.at("position").get<Position>();
}

} // namespace lspc
