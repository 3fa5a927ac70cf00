#ifndef DUPLEX_CORE_COMPAT_H
#define DUPLEX_CORE_COMPAT_H

// duplex is built as C++17; optional/variant resolve to the std:: versions
// and are re-exported into the duplex namespace so call sites stay short.

#include <optional>
#include <variant>

namespace duplex {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace duplex

#endif  // DUPLEX_CORE_COMPAT_H
