#pragma once

#include <stdexcept>
#include <string>

namespace hostlink {

/// Error taxonomy surfaced to automation clients.
enum class error_code {
  decode_error,
  unknown_command,
  invalid_params,
  entity_not_found,
  component_not_found,
  member_not_found,
  type_not_found,
  conversion_error,
  read_only,
  timeout,
  host_exception,
  host_stopped,
};

/// Stable wire name of an error code.
inline const char *to_string(error_code code) {
  switch (code) {
  case error_code::decode_error:
    return "decode_error";
  case error_code::unknown_command:
    return "unknown_command";
  case error_code::invalid_params:
    return "invalid_params";
  case error_code::entity_not_found:
    return "entity_not_found";
  case error_code::component_not_found:
    return "component_not_found";
  case error_code::member_not_found:
    return "member_not_found";
  case error_code::type_not_found:
    return "type_not_found";
  case error_code::conversion_error:
    return "conversion_error";
  case error_code::read_only:
    return "read_only";
  case error_code::timeout:
    return "timeout";
  case error_code::host_exception:
    return "host_exception";
  case error_code::host_stopped:
    return "host_stopped";
  }
  return "host_exception";
}

/// Inverse of to_string(). Unknown names map to host_exception.
inline error_code error_code_from_string(const std::string &name) {
  static const error_code all[] = {
      error_code::decode_error,        error_code::unknown_command,
      error_code::invalid_params,      error_code::entity_not_found,
      error_code::component_not_found, error_code::member_not_found,
      error_code::type_not_found,      error_code::conversion_error,
      error_code::read_only,           error_code::timeout,
      error_code::host_exception,      error_code::host_stopped,
  };
  for (auto code : all) {
    if (name == to_string(code))
      return code;
  }
  return error_code::host_exception;
}

class bridge_error : public std::runtime_error {
public:
  bridge_error(error_code code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  error_code code() const { return code_; }

private:
  error_code code_;
};

} // namespace hostlink
