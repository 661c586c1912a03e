// refiner/refine/error.hpp - Terminal failures of a single call site
//
// Every failure aborts the current call site. The kind classifies the
// failure for diagnostics; all kinds are fatal.
//
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "refiner/refine/patch.hpp"
#include "refiner/refine/property_path.hpp"

namespace refiner
{

enum class ErrorKind : uint8_t {
  Configuration,     ///< Malformed rule, async schema, reused builder, preserved-key patch
  Validation,        ///< Schema rejected the extracted data
  PatchApplication,  ///< A patch was left unapplied
  Encoding,          ///< A value has no tree form
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::Configuration:
      return "configuration";
    case ErrorKind::Validation:
      return "validation";
    case ErrorKind::PatchApplication:
      return "patch-application";
    case ErrorKind::Encoding:
      return "encoding";
  }
  return "unknown";
}

class RefineError : public std::runtime_error
{
public:
  RefineError(ErrorKind kind, const std::string & message)
  : std::runtime_error(message), kind_(kind)
  {
  }

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

class ConfigurationError : public RefineError
{
public:
  explicit ConfigurationError(const std::string & message)
  : RefineError(ErrorKind::Configuration, message)
  {
  }
};

/// The first issue reported by a schema.
class ValidationError : public RefineError
{
public:
  ValidationError(const std::string & message, std::optional<PropertyPath> issue_path)
  : RefineError(ErrorKind::Validation, message), issue_path_(std::move(issue_path))
  {
  }

  /// Location of the issue inside the props, when the schema gave one.
  [[nodiscard]] const std::optional<PropertyPath> & issue_path() const noexcept
  {
    return issue_path_;
  }

private:
  std::optional<PropertyPath> issue_path_;
};

class PatchApplicationError : public RefineError
{
public:
  PatchApplicationError(
    const std::string & message, std::string first_unapplied_path_key,
    std::optional<PatchPhase> phase)
  : RefineError(ErrorKind::PatchApplication, message),
    first_unapplied_path_key_(std::move(first_unapplied_path_key)),
    phase_(phase)
  {
  }

  [[nodiscard]] const std::string & first_unapplied_path_key() const noexcept
  {
    return first_unapplied_path_key_;
  }

  /// Phase of the first unapplied patch, when known.
  [[nodiscard]] std::optional<PatchPhase> phase() const noexcept { return phase_; }

private:
  std::string first_unapplied_path_key_;
  std::optional<PatchPhase> phase_;
};

class EncodingError : public RefineError
{
public:
  explicit EncodingError(const std::string & message) : RefineError(ErrorKind::Encoding, message)
  {
  }
};

}  // namespace refiner
