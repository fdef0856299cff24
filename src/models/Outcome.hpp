#ifndef OUTCOME_HPP
#define OUTCOME_HPP

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// --- Result of one execution of a cached operation ---
// Either the value the operation returned or the exception it threw. The cache
// never looks inside either; it only hands the same Outcome to every caller.
template <typename T>
class Outcome {
public:
    static std::shared_ptr<const Outcome<T>> success(T value) {
        return std::shared_ptr<const Outcome<T>>(new Outcome<T>(std::move(value)));
    }

    static std::shared_ptr<const Outcome<T>> failure(std::exception_ptr error) {
        if (!error) {
            throw std::invalid_argument("Outcome failure requires a non-null exception_ptr");
        }
        return std::shared_ptr<const Outcome<T>>(new Outcome<T>(std::move(error)));
    }

    bool isSuccess() const { return value_.has_value(); }
    bool isFailure() const { return !isSuccess(); }

    // Returns the stored value, or rethrows the stored exception object itself.
    const T& value() const {
        if (!value_) {
            std::rethrow_exception(error_);
        }
        return *value_;
    }

    std::exception_ptr error() const { return error_; }

    // Human readable description of a failure, empty for a success.
    std::string errorMessage() const {
        if (!error_) {
            return "";
        }
        try {
            std::rethrow_exception(error_);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "non-standard exception";
        }
    }

private:
    explicit Outcome(T value) : value_(std::move(value)) {}
    explicit Outcome(std::exception_ptr error) : error_(std::move(error)) {}

    std::optional<T> value_;
    std::exception_ptr error_;
};

template <typename T>
using OutcomePtr = std::shared_ptr<const Outcome<T>>;

#endif // OUTCOME_HPP
