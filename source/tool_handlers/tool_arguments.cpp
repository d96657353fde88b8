#include "tool_handlers/tool_arguments.hpp"

namespace tool_arguments {

bool is_present(const json &arguments, const char *name) {
    return arguments.is_object() && arguments.contains(name) && !arguments[name].is_null();
}

bool optional_string(const json &arguments, const char *name, std::string &value, std::string &error) {
    if (!is_present(arguments, name)) {
        return true;
    }
    const json &member = arguments[name];
    if (!member.is_string()) {
        error = std::string(name) + " must be a string";
        return false;
    }
    value = member.get<std::string>();
    return true;
}

bool optional_number(const json &arguments, const char *name, double &value, std::string &error) {
    if (!is_present(arguments, name)) {
        return true;
    }
    const json &member = arguments[name];
    if (!member.is_number()) {
        error = std::string(name) + " must be a number";
        return false;
    }
    value = member.get<double>();
    return true;
}

bool optional_integer(const json &arguments, const char *name, int64_t &value, std::string &error) {
    if (!is_present(arguments, name)) {
        return true;
    }
    const json &member = arguments[name];
    if (!member.is_number_integer()) {
        error = std::string(name) + " must be an integer";
        return false;
    }
    if (member.is_number_unsigned() && member.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
        error = std::string(name) + " is out of range";
        return false;
    }
    value = member.get<int64_t>();
    return true;
}

bool optional_boolean(const json &arguments, const char *name, bool &value, std::string &error) {
    if (!is_present(arguments, name)) {
        return true;
    }
    const json &member = arguments[name];
    if (!member.is_boolean()) {
        error = std::string(name) + " must be a boolean";
        return false;
    }
    value = member.get<bool>();
    return true;
}

bool has_content(const std::string &text) {
    return text.find_first_not_of(" \t\r\n\f\v") != std::string::npos;
}

} // namespace tool_arguments
