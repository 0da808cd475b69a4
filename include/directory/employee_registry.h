#pragma once

/**
 * @file employee_registry.h
 * @brief Authenticated employees and the doors they may open
 */

#include "errors.h"
#include <optional>
#include <string>
#include <vector>

namespace gate_sentry {

struct Employee {
    std::string name;
    std::string greeting;
    std::vector<std::string> doors;  ///< Camera/door ids this employee may pass
};

/**
 * @brief Read-only employee list, loaded once at startup
 *
 * File format: [{"name": "...", "greeting": "...", "permissions": {"doors": ["gate-1"]}}]
 */
class EmployeeRegistry {
public:
    EmployeeRegistry() = default;
    explicit EmployeeRegistry(std::vector<Employee> employees);

    static Result<EmployeeRegistry> load_from_file(const std::string& path);

    /// Case-insensitive lookup by name
    std::optional<Employee> find(const std::string& name) const;

    /// True if the named employee exists and lists door_id
    bool is_authorized(const std::string& name, const std::string& door_id) const;

    size_t size() const { return employees_.size(); }

private:
    std::vector<Employee> employees_;
};

} // namespace gate_sentry
