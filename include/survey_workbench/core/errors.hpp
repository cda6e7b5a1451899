#pragma once

#include <stdexcept>
#include <string>

namespace survey_workbench {

class WorkbenchError : public std::runtime_error {
public:
    explicit WorkbenchError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public WorkbenchError {
public:
    explicit ConfigError(const std::string& message)
        : WorkbenchError("Config error: " + message) {}
};

// Missing or malformed user input. Raised before any filesystem mutation.
class ValidationError : public WorkbenchError {
public:
    explicit ValidationError(const std::string& message)
        : WorkbenchError(message) {}
};

class IOError : public WorkbenchError {
public:
    explicit IOError(const std::string& message)
        : WorkbenchError("I/O error: " + message) {}
};

class CsvError : public IOError {
public:
    explicit CsvError(const std::string& message)
        : IOError("CSV error: " + message) {}
};

class MasterfileError : public IOError {
public:
    explicit MasterfileError(const std::string& message)
        : IOError("Masterfile error: " + message) {}
};

class BundleError : public WorkbenchError {
public:
    explicit BundleError(const std::string& message)
        : WorkbenchError("Template bundle error: " + message) {}
};

} // namespace survey_workbench
