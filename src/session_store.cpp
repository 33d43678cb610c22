/**
 * @file session_store.cpp
 * @brief File-backed session store for PulseWire
 */

#include "pulsewire/session_store.hpp"
#include "pulsewire/errors.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace pulsewire {

void validate_session_name(const std::string& name) {
    if (name.empty() || name.size() > 64) {
        throw ValidationError("Session name must be 1 to 64 characters", "session_name", name);
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            throw ValidationError("Session name may only contain letters, digits, '_' and '-'",
                                  "session_name", name);
        }
    }
}

FileSessionStore::FileSessionStore(const std::optional<std::string>& directory)
    : directory_(get_pulsewire_session_dir(directory)) {
}

std::string FileSessionStore::path_for(const std::string& name) const {
    validate_session_name(name);
    return (fs::path(directory_) / (name + ".json")).string();
}

bool FileSessionStore::exists(const std::string& name) {
    std::string path = path_for(name);
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::string> FileSessionStore::load(const std::string& name) {
    std::string path = path_for(name);
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw SessionError("Cannot open session file: " + path, name);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void FileSessionStore::save(const std::string& name, const std::string& blob) {
    std::string path = path_for(name);
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw SessionError("Cannot create session directory " + directory_ + ": " + ec.message(), name);
    }

    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw SessionError("Cannot write session file: " + temp_path, name);
        }
        file << blob;
        file.flush();
        if (!file) {
            throw SessionError("Failed writing session file: " + temp_path, name);
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        throw SessionError("Cannot replace session file " + path + ": " + ec.message(), name);
    }
}

void FileSessionStore::remove(const std::string& name) {
    std::string path = path_for(name);
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw SessionError("Cannot delete session file " + path + ": " + ec.message(), name);
    }
}

} // namespace pulsewire
