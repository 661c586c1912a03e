// refiner/refine/patch_guards.cpp - Reject patches aimed at runtime-owned subtrees
#include "refiner/refine/patch_guards.hpp"

#include <cctype>
#include <fmt/format.h>
#include <optional>

#include "refiner/refine/error.hpp"

namespace refiner
{

namespace
{

std::optional<std::string> find_restricted_key(
  const PropertyPatch & patch, const PreservedKeySet & restricted, GuardScope scope)
{
  for (const auto & segment : patch.path) {
    const auto * key = std::get_if<std::string>(&segment);
    if (key && restricted.count(*key) > 0) return *key;
    if (scope == GuardScope::RootOnly) break;
  }
  return std::nullopt;
}

std::string capitalize(std::string text)
{
  if (!text.empty()) {
    text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
  }
  return text;
}

}  // namespace

void assert_patches_respect_preservation(
  const std::vector<PropertyPatch> & patches, const PreservedKeySet & restricted_keys,
  std::string_view component_name, const PreservationCheckOptions & options)
{
  for (const auto & patch : patches) {
    const auto violated = find_restricted_key(patch, restricted_keys, options.scope);
    if (!violated) continue;

    const std::string path_detail =
      options.scope == GuardScope::Anywhere
        ? fmt::format(" at {}", stringify_property_path(patch.path))
        : std::string();

    throw ConfigurationError(fmt::format(
      "Patch targets {} key \"{}\"{} for {}. {} keys must not be patched as they represent "
      "runtime-owned subtrees.",
      options.key_type_label, *violated, path_detail, component_name,
      capitalize(options.key_type_label)));
  }
}

}  // namespace refiner
