#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace ConsoleGate {

/**
 * @brief Failure value carried by Result
 *
 * `message` is what a caller may show (for rejections it is the reason
 * after "Command not allowed: "). `code` is a Core::ErrorCode as int,
 * `component` is the logger tag of the module that failed.
 */
struct Error {
    std::string message;
    int code{0};
    std::string component;

    Error() = default;
    explicit Error(std::string msg, int c = 0, std::string comp = "")
        : message(std::move(msg)), code(c), component(std::move(comp)) {}

    bool is(int c) const { return code == c; }

    // "[Component] message (code: N)"
    std::string toString() const {
        std::string out = component.empty() ? message : "[" + component + "] " + message;
        if (code != 0) {
            out += " (code: " + std::to_string(code) + ")";
        }
        return out;
    }
};

/**
 * @brief Value-or-Error return type used on the request path
 *
 *   auto clean = InputSanitizer::sanitize(raw);
 *   if (clean.isError()) {
 *       return ResponseComposer::compose(clean.error());
 *   }
 *
 * value() on an error (or error() on a value) is a programming mistake and
 * throws std::logic_error.
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool isOk() const { return std::holds_alternative<T>(data_); }
    bool isError() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return isOk(); }

    T& value() {
        requireValue();
        return std::get<T>(data_);
    }

    const T& value() const {
        requireValue();
        return std::get<T>(data_);
    }

    const E& error() const {
        if (isOk()) {
            throw std::logic_error("error() called on a successful Result");
        }
        return std::get<E>(data_);
    }

private:
    void requireValue() const {
        if (isError()) {
            throw std::logic_error("value() called on failed Result: " + std::get<E>(data_).toString());
        }
    }

    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(const E& error) : failed_(true), error_(error) {}
    Result(E&& error) : failed_(true), error_(std::move(error)) {}

    bool isOk() const { return !failed_; }
    bool isError() const { return failed_; }
    explicit operator bool() const { return isOk(); }

    const E& error() const {
        if (!failed_) {
            throw std::logic_error("error() called on a successful Result");
        }
        return error_;
    }

private:
    bool failed_{false};
    E error_;
};

using VoidResult = Result<void, Error>;

inline VoidResult Ok() {
    return VoidResult();
}

} // namespace ConsoleGate
