#ifndef AUTHKIT_COMPAT_H
#define AUTHKIT_COMPAT_H

// Vocabulary types used across authkit. The library is built as C++17, so
// these resolve to the standard optional/variant.

#include <optional>
#include <variant>

namespace authkit {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using bad_optional_access = std::bad_optional_access;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using bad_variant_access = std::bad_variant_access;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace authkit

#endif  // AUTHKIT_COMPAT_H
