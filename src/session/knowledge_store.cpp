#include "session/knowledge_store.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "session/history_store.hpp"

namespace autopilot::session {

using nlohmann::json;

namespace {

constexpr const char* kDiscoveryMethod = "__capabilities__";

}  // namespace

KnowledgeStore::KnowledgeStore(std::filesystem::path path) : path_(std::move(path)) {}

void KnowledgeStore::load() {
    capabilities_.clear();
    std::ifstream in(path_);
    if (!in.is_open()) {
        return;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        LOG_WARN("Ignoring unreadable knowledge file: " + path_.string());
        return;
    }

    for (const auto& [tool, entry] : document.items()) {
        const auto list = entry.find("capabilities");
        if (list == entry.end() || !list->is_array()) {
            continue;
        }
        std::vector<std::string> texts;
        for (const auto& text : *list) {
            if (text.is_string()) {
                texts.push_back(text.get<std::string>());
            }
        }
        capabilities_[tool] = std::move(texts);
    }
}

bool KnowledgeStore::learn_from(const std::string& tool, const json& arguments,
                                const json& result) {
    if (!arguments.is_object() || arguments.value("method", json()) != kDiscoveryMethod) {
        return false;
    }
    if (!result.is_object() || result.empty()) {
        return false;
    }
    const auto is_error = result.find("isError");
    if (is_error != result.end() && is_error->is_boolean() && is_error->get<bool>()) {
        return false;
    }
    const auto content = result.find("content");
    if (content == result.end() || !content->is_array()) {
        return false;
    }

    std::vector<std::string> texts;
    for (const auto& entry : *content) {
        if (entry.is_object() && entry.contains("text") && entry.at("text").is_string()) {
            texts.push_back(entry.at("text").get<std::string>());
        }
    }
    if (texts.empty()) {
        return false;
    }

    LOG_INFO("Learned new capabilities for tool '" + tool + "'.");
    capabilities_[tool] = std::move(texts);
    return true;
}

core::errors::Status KnowledgeStore::save() const {
    json document = json::object();
    for (const auto& [tool, texts] : capabilities_) {
        document[tool]["capabilities"] = texts;
    }
    return write_json_atomically(path_, document);
}

std::string KnowledgeStore::describe() const {
    std::ostringstream out;
    for (const auto& [tool, texts] : capabilities_) {
        out << "Known capabilities of \"" << tool << "\":\n";
        for (const auto& text : texts) {
            out << "- " << text << "\n";
        }
    }
    return out.str();
}

}  // namespace autopilot::session
