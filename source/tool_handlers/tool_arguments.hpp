#ifndef TOOLGATE_TOOL_ARGUMENTS_HPP
#define TOOLGATE_TOOL_ARGUMENTS_HPP

// Typed access to optional members of a tools/call arguments object.
// Each reader leaves value untouched when the member is absent or null, and
// returns false with a message in error when it is present with the wrong type.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace tool_arguments {

using json = nlohmann::json;

bool is_present(const json &arguments, const char *name);

bool optional_string(const json &arguments, const char *name, std::string &value, std::string &error);

// Accepts integers and floating point values.
bool optional_number(const json &arguments, const char *name, double &value, std::string &error);

// Accepts only integral JSON numbers (5, not 5.0).
bool optional_integer(const json &arguments, const char *name, int64_t &value, std::string &error);

bool optional_boolean(const json &arguments, const char *name, bool &value, std::string &error);

// True if text contains anything besides blanks.
bool has_content(const std::string &text);

} // namespace tool_arguments

#endif // TOOLGATE_TOOL_ARGUMENTS_HPP
