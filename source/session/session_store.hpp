#ifndef CMCPS_SESSION_STORE_HPP
#define CMCPS_SESSION_STORE_HPP

// Persisted mapping from session id to a small configuration record.
//
// The whole store is one JSON document: { "<session id>": <record>, ... }.
// Every operation reloads the document from its backend, so records written
// by another process (a restart, or a sibling server sharing the file) are
// observed. Updates are whole-document read-modify-write; last writer wins.

#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace session_store {

using json = nlohmann::json;

// Storage I/O failure or an undecodable document.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Where a store document lives. Implementations throw StorageError.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // The full document; an empty object if nothing has been stored yet.
    virtual json load() = 0;

    // Replace the full document.
    virtual void save(const json &document) = 0;

    // Human-readable location, for log and error messages.
    virtual std::string describe() const = 0;
};

// A JSON file on disk. Missing file = empty store. Writes are atomic
// (temp file + rename) and create parent directories.
class FileStorageBackend : public StorageBackend {
public:
    explicit FileStorageBackend(std::string file_path);

    json load() override;
    void save(const json &document) override;
    std::string describe() const override;

private:
    std::string file_path_;
};

// Process-local document, for tests.
class MemoryStorageBackend : public StorageBackend {
public:
    json load() override;
    void save(const json &document) override;
    std::string describe() const override;

    int save_count() const { return save_count_; }

private:
    json document_ = json::object();
    int save_count_ = 0;
};

// Typed view over a backend. Record needs to_json/from_json and must be
// default-constructible; the default value is the record of a new session.
template <typename Record>
class SessionStore {
public:
    explicit SessionStore(std::shared_ptr<StorageBackend> backend)
        : backend_(std::move(backend)) {}

    // Existing record, or a default one which is persisted before returning.
    Record get_or_create(const std::string &session_id) {
        json document = backend_->load();
        auto existing = document.find(session_id);
        if (existing != document.end()) {
            return decode(*existing, session_id);
        }

        Record record{};
        document[session_id] = record;
        backend_->save(document);
        return record;
    }

    // Load (or default) the record, apply the mutation, persist the whole record.
    void update(const std::string &session_id, const std::function<void(Record &)> &mutation) {
        json document = backend_->load();
        Record record{};
        auto existing = document.find(session_id);
        if (existing != document.end()) {
            record = decode(*existing, session_id);
        }

        mutation(record);
        document[session_id] = record;
        backend_->save(document);
    }

    const StorageBackend &backend() const { return *backend_; }

private:
    Record decode(const json &value, const std::string &session_id) const {
        try {
            return value.get<Record>();
        } catch (const json::exception &error) {
            throw StorageError("invalid session '" + session_id + "' in " + backend_->describe() + ": " + error.what());
        } catch (const std::invalid_argument &error) {
            throw StorageError("invalid session '" + session_id + "' in " + backend_->describe() + ": " + error.what());
        }
    }

    std::shared_ptr<StorageBackend> backend_;
};

} // namespace session_store

#endif // CMCPS_SESSION_STORE_HPP
