#ifndef APPTRACE_CORE_ERROR_H_
#define APPTRACE_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace apptrace {
namespace core {

/**
 * @brief Base class for all collector errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        CONFIGURATION = 2,
        STORAGE = 3
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN) 
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN) 
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message) 
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message) 
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Unrecognized backend selection or missing connection descriptor.
 *
 * Fatal at startup: the collector does not begin serving.
 */
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message) 
        : Error(message, Code::CONFIGURATION) {}
    explicit ConfigurationError(const char* message) 
        : Error(message, Code::CONFIGURATION) {}
};

/**
 * @brief A write or read against a database backend failed
 */
class StorageError : public Error {
public:
    explicit StorageError(const std::string& message) 
        : Error(message, Code::STORAGE) {}
    explicit StorageError(const char* message) 
        : Error(message, Code::STORAGE) {}
};

} // namespace core
} // namespace apptrace

#endif // APPTRACE_CORE_ERROR_H_
