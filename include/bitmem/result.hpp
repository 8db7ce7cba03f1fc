#ifndef BITMEM_RESULT_HPP_
#define BITMEM_RESULT_HPP_

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace bitmem {

// ============================================================================
// Result
// ============================================================================

/**
 * Outcome of a fallible parse or validation: either a value or an error
 * message. Used for value-domain checks; contract violations throw instead.
 */
template <typename T>
class result {
public:
    using value_type = T;

    [[nodiscard]] static result success(T value) {
        result r;
        r.value_ = std::move(value);
        return r;
    }

    [[nodiscard]] static result failure(std::string error) {
        result r;
        r.error_ = std::move(error);
        return r;
    }

    [[nodiscard]] bool ok() const noexcept { return value_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    /**
     * @throws std::bad_optional_access if this is a failure
     */
    [[nodiscard]] const T& value() const& { return value_.value(); }
    [[nodiscard]] T&& value() && { return std::move(value_).value(); }

    [[nodiscard]] const std::string& error() const noexcept { return error_; }

    [[nodiscard]] T value_or(T fallback) const {
        return value_.has_value() ? *value_ : std::move(fallback);
    }

    // Transform the success value; failures pass through unchanged
    template <typename F>
    [[nodiscard]] auto map(F&& fn) const -> result<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        if (!ok()) {
            return result<U>::failure(error_);
        }
        return result<U>::success(std::forward<F>(fn)(*value_));
    }

    // Chain a further fallible step; fn must return a result
    template <typename F>
    [[nodiscard]] auto and_then(F&& fn) const -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (!ok()) {
            return R::failure(error_);
        }
        return std::forward<F>(fn)(*value_);
    }

private:
    result() = default;

    std::optional<T> value_;
    std::string error_;
};

/**
 * Combine a list of results into one. Fails with the first failure's
 * error, otherwise succeeds with all values in order.
 */
template <typename T>
[[nodiscard]] result<std::vector<T>> collect(const std::vector<result<T>>& results) {
    std::vector<T> values;
    values.reserve(results.size());
    for (const auto& r : results) {
        if (!r.ok()) {
            return result<std::vector<T>>::failure(r.error());
        }
        values.push_back(r.value());
    }
    return result<std::vector<T>>::success(std::move(values));
}

} // namespace bitmem

#endif // BITMEM_RESULT_HPP_
