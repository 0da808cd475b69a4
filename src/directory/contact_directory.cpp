#include "directory/contact_directory.h"
#include "logger.h"
#include "utils.h"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gate_sentry {

ContactDirectory::ContactDirectory(std::map<std::string, std::string> contacts)
    : contacts_(std::move(contacts)) {}

Result<ContactDirectory> ContactDirectory::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Cannot open contacts file: " + path);
    }

    std::map<std::string, std::string> contacts;
    try {
        json j;
        file >> j;
        if (j.contains("contacts") && j["contacts"].is_array()) {
            for (const auto& entry : j["contacts"]) {
                if (!entry.contains("name") || !entry.contains("email")) {
                    Logger::warn("Skipping contact entry without name/email in " + path);
                    continue;
                }
                contacts[entry["name"].get<std::string>()] = entry["email"].get<std::string>();
            }
        } else if (j.is_object()) {
            for (auto it = j.begin(); it != j.end(); ++it) {
                if (it.value().is_string()) {
                    contacts[it.key()] = it.value().get<std::string>();
                }
            }
        } else {
            return make_parse_error("Contacts file must hold an object: " + path);
        }
    } catch (const json::exception& e) {
        return make_parse_error("Failed to parse " + path + ": " + e.what());
    }

    Logger::info("Loaded " + std::to_string(contacts.size()) + " contacts from " + path);
    return ContactDirectory(std::move(contacts));
}

std::optional<std::string> ContactDirectory::match(const std::string& name) const {
    std::string wanted = utils::trim_copy(name);
    if (wanted.empty()) return std::nullopt;

    if (contacts_.count(wanted)) {
        return wanted;
    }
    for (const auto& entry : contacts_) {
        if (utils::iequals(entry.first, wanted)) {
            return entry.first;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ContactDirectory::email_for(const std::string& name) const {
    auto it = contacts_.find(name);
    if (it == contacts_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> ContactDirectory::names() const {
    std::vector<std::string> out;
    out.reserve(contacts_.size());
    for (const auto& entry : contacts_) {
        out.push_back(entry.first);
    }
    return out;
}

} // namespace gate_sentry
