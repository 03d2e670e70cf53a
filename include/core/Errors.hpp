#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace LoOP {

/**
 * @brief Raised when a pipeline parameter or the shape of the input is invalid.
 *
 * Always detected before any distance is computed.
 */
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& parameter, const std::string& value, const std::string& reason)
        : std::runtime_error("Invalid " + parameter + " = " + value + ": " + reason),
          parameter_(parameter),
          value_(value) {
    }

    const std::string& parameter() const { return parameter_; }
    const std::string& value() const { return value_; }

private:
    std::string parameter_;
    std::string value_;
};

/**
 * @brief Raised when a cluster has no usable dispersion.
 *
 * cluster_id is empty when the condition is detected over the whole dataset.
 */
class DegenerateClusterError : public std::runtime_error {
public:
    DegenerateClusterError(std::optional<int> cluster_id, const std::string& field, const std::string& reason)
        : std::runtime_error(build_message(cluster_id, field, reason)), cluster_id_(cluster_id), field_(field) {
    }

    const std::optional<int>& cluster_id() const { return cluster_id_; }
    const std::string& field() const { return field_; }

private:
    std::optional<int> cluster_id_;
    std::string field_;

    static std::string build_message(const std::optional<int>& cluster_id, const std::string& field,
                                     const std::string& reason) {
        std::string where = cluster_id ? "cluster " + std::to_string(*cluster_id) : "all clusters";
        return "Degenerate " + field + " in " + where + ": " + reason;
    }
};

}  // namespace LoOP
