/**
 * @file config.hpp
 * @author Ashot Vardanian
 *
 * @brief Database and codec configurations.
 *
 * A versioned JSON document, shared by all engines:
 * @code{.json}
 * {
 *     "version": "1.0",
 *     "directory": "./tmp/",
 *     "data_directories": [{"path": "/mnt/disk0/", "max_size": "100GB"}],
 *     "engine": {"config_file_path": "./rocksdb.ini", "config": {"DBOptions": {}, "CFOptions": {}}},
 *     "codec": {"format": "binary", "pooled": false},
 *     "flush": false
 * }
 * @endcode
 */
#pragma once

#include <limits>            // `std::numeric_limit`
#include <memory>            // `std::shared_ptr`
#include <string>            // `std::string`
#include <vector>            // `std::vector`
#include <nlohmann/json.hpp> // `nlohmann::json`

#include "ustash/status.hpp" // `status_t`

namespace unum::ustash {

using json_t = nlohmann::json;

class codec_t;

/**
 * @brief Storage disk configuration
 *
 * @path: Data directory path on the disk
 * @max_size: Space limit used by DBMS
 */
struct disk_config_t {
    static constexpr size_t unlimited_space_k = std::numeric_limits<size_t>::max(); // Not limited by software

    std::string path;
    size_t max_size = unlimited_space_k;
};

/**
 * @brief Engine configuration
 *
 * @config_file_path: Local config file path, in the engine's native format.
 * @config: Overrides in key-value format.
 */
struct engine_config_t {
    std::string config_file_path;
    json_t config;
};

/**
 * @brief Wire format of stored values.
 *
 * @format: One of "binary", "json" or "xml".
 * @pooled: Recycle encoders and decoders. Only text formats can be pooled
 *          from a config, as binary ones need to be primed first.
 */
struct codec_config_t {
    std::string format = "binary";
    bool pooled = false;
};

/**
 * @brief DBMS configuration
 *
 * @directory: Main path where DB stores data and metadata.
 * @data_directories: Additional storage paths, where supported.
 * @flush: Persist every commit before returning from it.
 */
struct config_t {
    std::string directory;
    std::vector<disk_config_t> data_directories;
    engine_config_t engine;
    codec_config_t codec;
    bool flush = false;
};

/**
 * @brief DBMS configurations loader
 */
class config_loader_t {
  public:
    static constexpr uint8_t current_major_version_k = 1;
    static constexpr uint8_t current_minor_version_k = 0;

  public:
    static status_t load_from_json(json_t const& json, config_t& config) noexcept;
    static status_t load_from_json_string(std::string const& str_json,
                                          config_t& config,
                                          bool ignore_comments = false) noexcept;

    static status_t save_to_json(config_t const& config, json_t& json) noexcept;
    static status_t save_to_json_string(config_t const& config, std::string& str_json) noexcept;

    static std::string current_version();

  private:
    static status_t validate_config(json_t const& json) noexcept;

    static bool parse_version(std::string const& str_version, uint8_t& major, uint8_t& minor) noexcept;
    static bool parse_volume(json_t const& json, std::string const& key, size_t& bytes) noexcept;
    static bool parse_bytes(std::string const& str, size_t& bytes) noexcept;
};

/**
 * @brief Builds the codec named in the config: a plain one, or a pooled text codec.
 */
expected_gt<std::shared_ptr<codec_t const>> make_codec(codec_config_t const& config) noexcept;

} // namespace unum::ustash
