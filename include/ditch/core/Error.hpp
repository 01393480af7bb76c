#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ditch::core {

class Error : public std::runtime_error {
public:
    explicit Error(std::string message);
    virtual ~Error() = default;
};

inline Error::Error(std::string message)
    : std::runtime_error(std::move(message)) {}

/// Thrown when a tuning value cannot drive the simulation (non-positive durations, empty field, ...).
class ConfigError : public Error {
public:
    ConfigError(std::string_view field, std::string details);

    std::string_view field() const noexcept { return m_field; }
    std::string_view details() const noexcept { return m_details; }

private:
    static std::string BuildMessage(std::string_view field, const std::string& details);

    std::string m_field;
    std::string m_details;
};

inline std::string ConfigError::BuildMessage(std::string_view field, const std::string& details) {
    std::string message;
    message.reserve(field.size() + details.size() + 24);
    message.append("Invalid configuration [");
    message.append(field);
    message.append("]");
    if (!details.empty()) {
        message.append(": ");
        message.append(details);
    }
    return message;
}

inline ConfigError::ConfigError(std::string_view field, std::string details)
    : Error(BuildMessage(field, details)),
      m_field(field),
      m_details(std::move(details)) {}

} // namespace ditch::core
