#pragma once

#include "taskweave/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace taskweave {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

/// An empty JSON object, the output of a task that has no handler.
[[nodiscard]] inline auto empty_json_object() -> JsonValue {
  return parse_json("{}").value_or(JsonValue{});
}

} // namespace taskweave
