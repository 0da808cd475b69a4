#include "directory/employee_registry.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gate_sentry {

EmployeeRegistry::EmployeeRegistry(std::vector<Employee> employees)
    : employees_(std::move(employees)) {}

Result<EmployeeRegistry> EmployeeRegistry::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_io_error("Cannot open employees file: " + path);
    }

    std::vector<Employee> employees;
    try {
        json j;
        file >> j;
        if (!j.is_array()) {
            return make_parse_error("Employees file must hold an array: " + path);
        }
        for (const auto& entry : j) {
            Employee e;
            e.name = entry.value("name", "");
            if (e.name.empty()) {
                Logger::warn("Skipping employee entry without name in " + path);
                continue;
            }
            e.greeting = entry.value("greeting", "Welcome, " + e.name + ".");
            if (entry.contains("permissions") && entry["permissions"].contains("doors")) {
                for (const auto& door : entry["permissions"]["doors"]) {
                    // Door ids may be written as numbers
                    e.doors.push_back(door.is_string() ? door.get<std::string>() : door.dump());
                }
            }
            employees.push_back(std::move(e));
        }
    } catch (const json::exception& e) {
        return make_parse_error("Failed to parse " + path + ": " + e.what());
    }

    Logger::info("Loaded " + std::to_string(employees.size()) + " employees from " + path);
    return EmployeeRegistry(std::move(employees));
}

std::optional<Employee> EmployeeRegistry::find(const std::string& name) const {
    std::string wanted = utils::trim_copy(name);
    for (const auto& e : employees_) {
        if (utils::iequals(e.name, wanted)) {
            return e;
        }
    }
    return std::nullopt;
}

bool EmployeeRegistry::is_authorized(const std::string& name, const std::string& door_id) const {
    auto employee = find(name);
    if (!employee || door_id.empty()) return false;
    return std::find(employee->doors.begin(), employee->doors.end(), door_id) != employee->doors.end();
}

} // namespace gate_sentry
