#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "nowcast_config.hpp"

/**
 * @file runtime_config.hpp
 * @brief Configuration file parsing and conversion helpers.
 *
 * Reads YAML-like configuration files into dotted keys and converts the
 * recognised keys into typed settings. Invalid literals are reported and
 * leave the default in place; semantic checks happen later in the engine.
 */

namespace nowcast
{

using ConfigMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Removes matching single or double quotes around a value.
 */
std::string strip_wrapping_quotes(std::string value);

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string.
 * @return Parsed boolean value.
 */
bool parse_bool_value(const std::string& value);

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a strictly positive integer value.
 */
bool try_parse_positive_int_value(const std::string& value, int& out);

/**
 * @brief Parses a finite floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Emits a standardized warning for invalid configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected);

/**
 * @brief Parses a comma-separated (or bracketed) list.
 */
std::vector<std::string> parse_string_list(const std::string& value);

/**
 * @brief Parses a simple key-value YAML file.
 *
 * Indented `section:` lines prefix the keys below them, so
 * `motion:` / `  block_size: 16` yields `motion.block_size`.
 *
 * @param filename Input file path.
 * @param error Set when the file cannot be opened.
 * @return Parsed key-value map, empty on failure.
 */
ConfigMap parse_yaml_simple(const std::string& filename, std::string* error = nullptr);

/**
 * @brief Applies `logging.profile` to the process-wide log profile.
 */
void apply_logging_config(const ConfigMap& config);

/**
 * @brief Applies engine keys (motion, advection, blend, sequencer,
 * validation, input) to a configuration.
 * @return Number of keys consumed.
 */
int apply_nowcast_config(const ConfigMap& config, NowcastConfig& out);

/**
 * @brief Reports whether a dotted key is recognised by any section.
 */
bool is_known_config_key(const std::string& key);

} // namespace nowcast
