#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include "core/errors/bridge_errors.hpp"

namespace cuebridge::core::messages {

// Keys of the user-facing texts for the distinguished failures.
inline constexpr const char* kExeNotFoundKey = "formatter.exeNotFound";
inline constexpr const char* kUserPathNotFoundKey = "formatter.userPathNotFound";
inline constexpr const char* kExecuteErrorKey = "formatter.cueExecuteError";

// Resolves message keys to localized text. Starts out with the English
// defaults; a JSON bundle ({"key": "text", ...}) replaces individual entries.
class MessageCatalog {
public:
    MessageCatalog();

    errors::Result<std::size_t> load_bundle(const std::filesystem::path& path);
    errors::Result<std::size_t> merge_json(const std::string& json_text);

    // Unknown keys resolve to the key itself.
    std::string get(const std::string& key) const;

    // Maps a BridgeError code to its catalog text, falling back to the
    // error's own message for codes without an entry.
    std::string describe(const errors::BridgeError& error) const;

private:
    std::unordered_map<std::string, std::string> entries_;
};

}  // namespace cuebridge::core::messages
