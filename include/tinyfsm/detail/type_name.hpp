#pragma once

#include <string_view>

namespace tinyfsm::detail {

template <typename T>
consteval std::string_view qualified_type_name() {
#if defined(__clang__)
  std::string_view name = __PRETTY_FUNCTION__;
  auto start = name.find("[T = ");
  if (start == std::string_view::npos) return "UNKNOWN";
  start += 5;
  auto end = name.find_last_of(']');
  return name.substr(start, end - start);
#elif defined(__GNUC__)
  std::string_view name = __PRETTY_FUNCTION__;
  auto start = name.find("[with T = ");
  if (start == std::string_view::npos) return "UNKNOWN";
  start += 10;
  // gcc appends the typedefs used in the signature: "...; std::string_view = ..."
  auto end = name.find(';', start);
  if (end == std::string_view::npos) end = name.find_last_of(']');
  return name.substr(start, end - start);
#elif defined(_MSC_VER)
  std::string_view name = __FUNCSIG__;
  auto start = name.find("qualified_type_name<");
  if (start == std::string_view::npos) return "UNKNOWN";
  start += 20;
  auto end = name.find_last_of('>');
  name = name.substr(start, end - start);
  for (std::string_view prefix : {"struct ", "class ", "enum "}) {
    if (name.starts_with(prefix)) name.remove_prefix(prefix.size());
  }
  return name;
#else
  return "UNKNOWN";
#endif
}

// Unqualified name: "app::(anonymous namespace)::Idle" -> "Idle". Template
// arguments are kept as written.
template <typename T>
consteval std::string_view type_name() {
  std::string_view name = qualified_type_name<T>();
  const auto args = name.find('<');
  const auto scope = name.substr(0, args).rfind("::");
  if (scope != std::string_view::npos) name.remove_prefix(scope + 2);
  return name;
}

}  // namespace tinyfsm::detail
