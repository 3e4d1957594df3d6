#ifndef FTPD_CORE_COMPAT_H
#define FTPD_CORE_COMPAT_H

// Vocabulary aliases so the rest of the tree spells optional/variant the
// same way regardless of where they come from. Requires C++17.

#include <cstddef>
#include <optional>
#include <type_traits>
#include <variant>

namespace ftpd {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using bad_optional_access = std::bad_optional_access;
using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using monostate = std::monostate;
using bad_variant_access = std::bad_variant_access;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

// Helper for building a visitor out of lambdas
template <typename... Fs>
struct overloaded : Fs... {
  using Fs::operator()...;
};
template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

}  // namespace ftpd

#endif  // FTPD_CORE_COMPAT_H
