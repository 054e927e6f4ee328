#include "matrixforge/util/glob.hpp"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <span>
#include <system_error>

namespace matrixforge::util {

namespace {

[[nodiscard]] auto split_segments(std::string_view path)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> out;
  for (auto part : path | std::views::split('/')) {
    std::string_view seg(part.begin(), part.end());
    if (!seg.empty()) {
      out.push_back(seg);
    }
  }
  return out;
}

[[nodiscard]] auto match_segment(std::string_view pat, std::string_view text)
    -> bool {
  std::size_t p = 0;
  std::size_t t = 0;
  std::size_t star = std::string_view::npos;
  std::size_t resume = 0;
  while (t < text.size()) {
    if (p < pat.size() && (pat[p] == '?' || pat[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pat.size() && pat[p] == '*') {
      star = p++;
      resume = t;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      t = ++resume;
    } else {
      return false;
    }
  }
  while (p < pat.size() && pat[p] == '*') {
    ++p;
  }
  return p == pat.size();
}

[[nodiscard]] auto match_segments(std::span<const std::string_view> pat,
                                  std::span<const std::string_view> path)
    -> bool {
  if (pat.empty()) {
    return path.empty();
  }
  if (pat.front() == "**") {
    for (std::size_t skip = 0; skip <= path.size(); ++skip) {
      if (match_segments(pat.subspan(1), path.subspan(skip))) {
        return true;
      }
    }
    return false;
  }
  if (path.empty() || !match_segment(pat.front(), path.front())) {
    return false;
  }
  return match_segments(pat.subspan(1), path.subspan(1));
}

} // namespace

auto glob_match(std::string_view pattern, std::string_view path) -> bool {
  std::string normalized(pattern);
  if (normalized.ends_with('/')) {
    normalized += "**";
  }
  const auto pat = split_segments(normalized);
  const auto segs = split_segments(path);
  return match_segments(pat, segs);
}

auto split_patterns(std::string_view list) -> std::vector<std::string> {
  std::vector<std::string> out;
  std::string current;
  for (char c : list) {
    if (c == ',' || std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!current.empty()) {
        out.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    out.push_back(std::move(current));
  }
  return out;
}

auto matches_any(const std::vector<std::string> &patterns,
                 std::string_view path) -> bool {
  return std::ranges::any_of(
      patterns, [path](const auto &p) { return glob_match(p, path); });
}

auto copy_matching(const std::filesystem::path &from,
                   const std::filesystem::path &to,
                   const std::vector<std::string> &includes,
                   const std::vector<std::string> &excludes)
    -> Result<std::vector<std::string>> {
  namespace fs = std::filesystem;
  std::error_code ec;
  std::vector<std::string> copied;
  for (fs::recursive_directory_iterator it(from, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto &entry = *it;
    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      auto rel = entry.path().lexically_relative(from).generic_string() + "/**";
      if (std::ranges::contains(excludes, rel)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(type_ec)) {
      continue;
    }
    auto rel = fs::relative(entry.path(), from, ec).generic_string();
    if (ec) {
      return fail(ec);
    }
    if (!matches_any(includes, rel) ||
        (!excludes.empty() && matches_any(excludes, rel))) {
      continue;
    }
    auto dest = to / rel;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
      return fail(ec);
    }
    fs::copy_file(entry.path(), dest, fs::copy_options::overwrite_existing,
                  ec);
    if (ec) {
      return fail(ec);
    }
    copied.push_back(std::move(rel));
  }
  if (ec) {
    return fail(ec);
  }
  return ok(std::move(copied));
}

} // namespace matrixforge::util
