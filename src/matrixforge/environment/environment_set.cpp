#include "matrixforge/environment/environment_set.hpp"

#include "matrixforge/util/id.hpp"
#include "matrixforge/util/url.hpp"

#include <algorithm>
#include <utility>

namespace matrixforge {

namespace {

[[nodiscard]] auto is_valid_label(std::string_view label) -> bool {
  return is_valid_id_text(label) && label.find(',') == std::string_view::npos;
}

[[nodiscard]] auto is_separator(char c) -> bool {
  switch (c) {
  case ' ':
  case ',':
  case '\n':
  case '\r':
  case '\t':
  case '\f':
  case '\b':
    return true;
  default:
    return false;
  }
}

[[nodiscard]] auto is_quote(char c) -> bool {
  return c == '"' || c == '\'' || c == '`';
}

[[nodiscard]] auto needs_quoting(std::string_view token) -> bool {
  return std::ranges::any_of(token, [](char c) {
    return is_separator(c) || is_quote(c) || c == '\\';
  });
}

auto add_unique(EnvironmentConstraint &out, std::string token) -> void {
  if (!token.empty() && !std::ranges::contains(out, token)) {
    out.push_back(std::move(token));
  }
}

} // namespace

auto EnvironmentSet::from_labels(std::vector<std::string> labels)
    -> Result<EnvironmentSet> {
  if (!std::ranges::all_of(labels, is_valid_label)) {
    return fail(Error::InvalidArgument);
  }
  std::ranges::sort(labels);
  auto dup = std::ranges::unique(labels);
  labels.erase(dup.begin(), dup.end());
  if (labels.size() == 1 && labels.front() == kDefaultEnvironmentName) {
    return fail(Error::InvalidArgument);
  }
  return ok(EnvironmentSet{std::move(labels)});
}

auto EnvironmentSet::parse(std::string_view name) -> Result<EnvironmentSet> {
  if (name == kDefaultEnvironmentName) {
    return ok(EnvironmentSet{});
  }
  if (name.empty()) {
    return fail(Error::MalformedIdentifier);
  }

  std::vector<std::string> labels;
  for (auto part : name | std::views::split(',')) {
    std::string_view token(part.begin(), part.end());
    if (!is_valid_label(token)) {
      return fail(Error::MalformedIdentifier);
    }
    if (!labels.empty() && labels.back() >= token) {
      return fail(Error::MalformedIdentifier);
    }
    labels.emplace_back(token);
  }
  return ok(EnvironmentSet{std::move(labels)});
}

auto EnvironmentSet::canonical_name() const -> std::string {
  if (labels_.empty()) {
    return std::string{kDefaultEnvironmentName};
  }
  std::string out;
  for (const auto &label : labels_) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += label;
  }
  return out;
}

auto EnvironmentSet::contains(std::string_view label) const -> bool {
  return std::ranges::binary_search(labels_, label, std::less<>{});
}

auto EnvironmentSet::is_subset_of(const EnvironmentSet &other) const -> bool {
  return std::ranges::includes(other.labels_, labels_);
}

auto EnvironmentSet::matches(const EnvironmentConstraint &constraint) const
    -> bool {
  if (labels_.empty()) {
    return std::ranges::contains(constraint, kDefaultEnvironmentName);
  }
  return std::ranges::any_of(labels_, [&](const auto &label) {
    return std::ranges::contains(constraint, label);
  });
}

auto EnvironmentSet::directory_key() const -> std::filesystem::path {
  if (labels_.empty()) {
    return "env-";
  }
  std::filesystem::path out;
  for (const auto &label : labels_) {
    out /= "env-" + util::url_encode(label);
  }
  return out;
}

auto parse_environment_constraint(std::string_view text)
    -> std::optional<EnvironmentConstraint> {
  EnvironmentConstraint result;
  std::string current;
  std::optional<char> in_quote;
  bool in_escape = false;

  for (char c : text) {
    if (c == '\\') {
      if (in_escape) {
        current.push_back(c);
      }
      in_escape = !in_escape;
      continue;
    }
    if (in_escape) {
      current.push_back(c);
      in_escape = false;
      continue;
    }
    if (is_quote(c)) {
      if (!in_quote) {
        in_quote = c;
      } else if (*in_quote == c) {
        add_unique(result, std::exchange(current, {}));
        in_quote.reset();
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (is_separator(c) && !in_quote) {
      add_unique(result, std::exchange(current, {}));
      continue;
    }
    current.push_back(c);
  }
  add_unique(result, std::move(current));

  if (result.empty()) {
    return std::nullopt;
  }
  return result;
}

auto format_environment_constraint(const EnvironmentConstraint &constraint)
    -> std::optional<std::string> {
  std::string out;
  for (const auto &token : constraint) {
    if (token.empty()) {
      continue;
    }
    if (!out.empty()) {
      out.push_back(' ');
    }
    if (!needs_quoting(token)) {
      out += token;
      continue;
    }
    out.push_back('"');
    for (char c : token) {
      if (is_quote(c) || c == '\\') {
        out.push_back('\\');
      }
      out.push_back(c);
    }
    out.push_back('"');
  }
  if (out.empty()) {
    return std::nullopt;
  }
  return out;
}

} // namespace matrixforge
