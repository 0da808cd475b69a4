#pragma once

/**
 * @file contact_directory.h
 * @brief Known internal contacts a visitor may ask for
 */

#include "errors.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gate_sentry {

/**
 * @brief Immutable name -> email lookup, loaded once at startup
 *
 * File format: {"contacts": [{"name": "...", "email": "..."}, ...]}
 * or a flat object {"Name": "email", ...}.
 */
class ContactDirectory {
public:
    ContactDirectory() = default;
    explicit ContactDirectory(std::map<std::string, std::string> contacts);

    static Result<ContactDirectory> load_from_file(const std::string& path);

    /**
     * @brief Resolve a spoken name to the directory's spelling
     *
     * Exact match first, then case-insensitive (surrounding whitespace ignored).
     */
    std::optional<std::string> match(const std::string& name) const;

    /// Email for a canonical name
    std::optional<std::string> email_for(const std::string& name) const;

    std::vector<std::string> names() const;
    size_t size() const { return contacts_.size(); }
    bool empty() const { return contacts_.empty(); }

private:
    std::map<std::string, std::string> contacts_;
};

} // namespace gate_sentry
