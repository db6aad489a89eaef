#ifndef APPTRACE_CORE_RESULT_H_
#define APPTRACE_CORE_RESULT_H_

#include <optional>
#include <stdexcept>
#include <string>

namespace apptrace {
namespace core {

/**
 * @brief Outcome of a store or writer call: a value, or an error message
 *
 * Stores and writers never let exceptions cross their boundary; they catch
 * and report through this type instead.
 * ```
 * auto page = store->get_page(100, 0);
 * if (!page.ok()) {
 *     APPTRACE_ERROR("read failed: {}", page.error());
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;

    // Move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_.has_value(); }

    /**
     * @throws std::logic_error on an ok result
     */
    const std::string& error() const {
        if (!error_) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return *error_;
    }

    const T& value() const { return value_; }

    static Result<T> error(std::string message) {
        Result<T> result(T{});
        result.error_ = std::move(message);
        return result;
    }

private:
    T value_;
    std::optional<std::string> error_;
};

template<>
class Result<void> {
public:
    Result() = default;

    bool ok() const { return !error_.has_value(); }

    const std::string& error() const {
        if (!error_) {
            throw std::logic_error("Result is ok, not an error");
        }
        return *error_;
    }

    static Result<void> error(std::string message) {
        Result<void> result;
        result.error_ = std::move(message);
        return result;
    }

private:
    std::optional<std::string> error_;
};

} // namespace core
} // namespace apptrace

#endif // APPTRACE_CORE_RESULT_H_
