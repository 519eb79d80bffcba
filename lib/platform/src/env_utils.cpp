#include <platform/env_utils.hpp>

#include <cstdlib>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string_view>

#ifdef _WIN32
#include <memory>
#endif

namespace tidepool::platform {

auto get_home_directory() -> std::string
{
#ifdef _WIN32
  char *home_raw = nullptr;
  size_t len = 0;
  if (_dupenv_s(&home_raw, &len, "USERPROFILE") == 0 and home_raw != nullptr) {
    const std::unique_ptr<char, decltype(&free)> home(home_raw, &free);
    return { home.get() };
  }
  return "";
#else
  static std::mutex env_mutex;
  const std::scoped_lock lock(env_mutex);

  auto *home = std::getenv("HOME");// NOLINT(concurrency-mt-unsafe)
  return home != nullptr ? std::string(home) : "";
#endif
}

auto expand_tilde_path(const std::string &path) -> std::string
{
  if (not path.starts_with("~/")) { return path; }

  auto home = get_home_directory();
  if (home.empty()) { return path; }

  return home + path.substr(1);
}

auto read_trimmed_file(const std::string &path) -> std::string
{
  const auto expanded = expand_tilde_path(path);
  std::ifstream input(expanded);
  if (not input) { throw std::runtime_error("cannot open " + expanded); }

  std::ostringstream contents;
  contents << input.rdbuf();
  auto text = contents.str();

  constexpr std::string_view whitespace = " \t\r\n";
  const auto first = text.find_first_not_of(whitespace);
  if (first == std::string::npos) { return {}; }
  const auto last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

}// namespace tidepool::platform
