// src/config/config_error.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace config {

/**
 * ConfigurationError - Structural misconfiguration (missing sensor mapping,
 * unknown bay reference, impossible thresholds).
 *
 * Fatal: raised while loading or constructing, before any update cycle runs.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace config
