#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tinyweb {

// Values captured from the <name> segments of a route pattern, in pattern order.
class PathParams {
 public:
  using value_type = std::pair<std::string, std::string>;
  using const_iterator = std::vector<value_type>::const_iterator;

  void add(std::string_view name, std::string_view value) { _params.emplace_back(name, value); }

  // Returns the value bound to name, if any.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept {
    for (const auto& [paramName, value] : _params) {
      if (paramName == name) {
        return std::string_view(value);
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] const_iterator begin() const noexcept { return _params.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _params.end(); }

  [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }

  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  void clear() noexcept { _params.clear(); }

  bool operator==(const PathParams&) const noexcept = default;

 private:
  std::vector<value_type> _params;
};

}  // namespace tinyweb
