#ifndef BITSDB_CORE_TRI_STATE_H_
#define BITSDB_CORE_TRI_STATE_H_

#include <optional>
#include <utility>
#include <variant>

namespace bitsdb {
namespace core {

/**
 * @brief Marker states of an updatable field
 */
struct Unset {};
struct Clear {};

/**
 * @brief A field in an update request: left unchanged, cleared to null, or
 * set to a concrete value.
 *
 * ```
 * TriState<double> v;                 // unset: keep current
 * TriState<double> c = Clear{};       // clear to null
 * TriState<double> s = 10.0;          // set
 * ```
 */
template<typename T>
class TriState {
public:
    TriState() : state_(Unset{}) {}
    TriState(Unset) : state_(Unset{}) {}
    TriState(Clear) : state_(Clear{}) {}
    TriState(T value) : state_(std::move(value)) {}

    static TriState<T> unset() { return TriState<T>(); }
    static TriState<T> clear() { return TriState<T>(Clear{}); }
    static TriState<T> set(T value) { return TriState<T>(std::move(value)); }

    /**
     * @brief Set(v) for an engaged optional, Clear for nullopt
     */
    static TriState<T> from_optional(std::optional<T> value) {
        return value ? TriState<T>(std::move(*value)) : TriState<T>(Clear{});
    }

    bool is_unset() const { return std::holds_alternative<Unset>(state_); }
    bool is_clear() const { return std::holds_alternative<Clear>(state_); }
    bool is_set() const { return std::holds_alternative<T>(state_); }

    /**
     * @brief Only valid when is_set()
     */
    const T& get() const { return std::get<T>(state_); }

    /**
     * @brief Applies the field to a current nullable value
     */
    std::optional<T> merge(const std::optional<T>& current) const {
        if (is_unset()) {
            return current;
        }
        if (is_clear()) {
            return std::nullopt;
        }
        return get();
    }

    template<typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), state_);
    }

private:
    std::variant<Unset, Clear, T> state_;
};

} // namespace core
} // namespace bitsdb

#endif // BITSDB_CORE_TRI_STATE_H_
