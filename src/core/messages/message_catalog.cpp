#include "core/messages/message_catalog.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace cuebridge::core::messages {

using errors::BridgeError;
using errors::ErrorCategory;
using nlohmann::json;

MessageCatalog::MessageCatalog()
    : entries_{
          {kExeNotFoundKey,
           "The cue executable could not be found in PATH. Install cue or "
           "configure the path to the executable."},
          {kUserPathNotFoundKey,
           "The configured cue executable does not exist or is not executable."},
          {kExecuteErrorKey, "Error while executing cue."}} {}

errors::Result<std::size_t> MessageCatalog::merge_json(const std::string& json_text) {
    const json root = json::parse(json_text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return BridgeError{ErrorCategory::Input,
                           "Message bundle must be a JSON object of strings.",
                           "invalid_message_bundle"};
    }

    std::unordered_map<std::string, std::string> incoming;
    for (const auto& item : root.items()) {
        if (!item.value().is_string()) {
            return BridgeError{ErrorCategory::Input,
                               "Message bundle entry '" + item.key() +
                                   "' is not a string.",
                               "invalid_message_bundle"};
        }
        incoming[item.key()] = item.value().get<std::string>();
    }

    for (auto& [key, value] : incoming) {
        entries_[key] = std::move(value);
    }
    return incoming.size();
}

errors::Result<std::size_t> MessageCatalog::load_bundle(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return BridgeError{ErrorCategory::Input,
                           "Unable to open message bundle: " + path.string(),
                           "message_bundle_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return merge_json(buffer.str());
}

std::string MessageCatalog::get(const std::string& key) const {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return key;
    }
    return it->second;
}

std::string MessageCatalog::describe(const BridgeError& error) const {
    if (error.code == errors::kExecutableNotFound) {
        return get(kExeNotFoundKey);
    }
    if (error.code == errors::kUserPathNotFound) {
        return get(kUserPathNotFoundKey);
    }
    if (error.code == errors::kExecuteError) {
        return get(kExecuteErrorKey);
    }
    return error.message;
}

}  // namespace cuebridge::core::messages
