/**
 * @file session_store.hpp
 * @brief Session persistence for PulseWire
 */

#ifndef PULSEWIRE_SESSION_STORE_HPP
#define PULSEWIRE_SESSION_STORE_HPP

#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace pulsewire {

/**
 * Persists opaque session blobs by name. At-rest format is the store's concern.
 */
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual bool exists(const std::string& name) = 0;

    /**
     * Load a stored blob
     * @param name Session name
     * @return Blob, or nullopt when nothing is stored
     * @throws SessionError if the store cannot be read
     */
    virtual std::optional<std::string> load(const std::string& name) = 0;

    /**
     * Store a blob, replacing any previous one
     * @throws SessionError if the store cannot be written
     */
    virtual void save(const std::string& name, const std::string& blob) = 0;

    /**
     * Delete a stored blob. Removing a missing entry is not an error.
     */
    virtual void remove(const std::string& name) = 0;
};

/**
 * One JSON file per session under a directory
 */
class FileSessionStore : public SessionStore {
public:
    /**
     * Create a file store
     * @param directory Storage directory, defaults to ~/.pulsewire/sessions
     */
    explicit FileSessionStore(const std::optional<std::string>& directory = std::nullopt);

    const std::string& directory() const { return directory_; }

    bool exists(const std::string& name) override;
    std::optional<std::string> load(const std::string& name) override;
    void save(const std::string& name, const std::string& blob) override;
    void remove(const std::string& name) override;

private:
    std::string path_for(const std::string& name) const;

    std::string directory_;
    std::mutex mutex_;
};

/**
 * Check a session name against [A-Za-z0-9_-]{1,64}
 * @throws ValidationError if the name is unusable as a file name
 */
void validate_session_name(const std::string& name);

} // namespace pulsewire

#endif // PULSEWIRE_SESSION_STORE_HPP
