#include "session/session_store.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <filesystem>
#include <system_error>

namespace session_store {

FileStorageBackend::FileStorageBackend(std::string file_path)
    : file_path_(std::move(file_path)) {}

json FileStorageBackend::load() {
    std::error_code error;
    if (!std::filesystem::exists(file_path_, error)) {
        if (error) {
            throw StorageError("cannot access " + file_path_ + ": " + error.message());
        }
        return json::object();
    }

    std::string contents;
    if (!platform::read_file_contents(file_path_, contents)) {
        throw StorageError("cannot read session file " + file_path_);
    }
    if (contents.find_first_not_of(" \t\r\n") == std::string::npos) {
        return json::object();
    }

    json document;
    try {
        document = json::parse(contents);
    } catch (const json::parse_error &parse_error) {
        throw StorageError("session file " + file_path_ + " is not valid JSON: " + parse_error.what());
    }
    if (!document.is_object()) {
        throw StorageError("session file " + file_path_ + " must contain a JSON object");
    }
    return document;
}

void FileStorageBackend::save(const json &document) {
    std::string contents;
    try {
        contents = document.dump(2) + "\n";
    } catch (const json::type_error &type_error) {
        // Strings that are not valid UTF-8 cannot be written as JSON.
        throw StorageError("cannot encode session file " + file_path_ + ": " + type_error.what());
    }

    std::string error_message;
    if (!platform::write_file_atomically(file_path_, contents, error_message)) {
        throw StorageError("cannot write session file " + file_path_ + ": " + error_message);
    }
    debug_log::log("session store saved: " + file_path_);
}

std::string FileStorageBackend::describe() const {
    return file_path_;
}

json MemoryStorageBackend::load() {
    return document_;
}

void MemoryStorageBackend::save(const json &document) {
    document_ = document;
    ++save_count_;
}

std::string MemoryStorageBackend::describe() const {
    return "<memory>";
}

} // namespace session_store
