/**
 * @file config.cpp
 * @author Ashot Vardanian
 *
 * @brief Loading, validating and saving DBMS configurations.
 */

#include <cctype>  // `std::isdigit`
#include <cmath>   // `std::isnan`
#include <sstream> // `std::stringstream`

#include "ustash/config.hpp"
#include "ustash/pooled_codec.hpp"

namespace unum::ustash {

status_t config_loader_t::load_from_json(json_t const& json, config_t& config) noexcept {
    return safe_section("Loading config", args_wrong_k, [&]() -> status_t {
        return_error_if_m(json.is_object(), args_wrong_k, "Config must be a JSON object");
        auto status = validate_config(json);
        return_if_error_m(status);

        // Main directory
        config.directory = json.value("directory", "");
        config.flush = json.value("flush", false);

        // Storage disks
        config.data_directories.clear();
        if (json.contains("data_directories")) {
            auto const& j_disks = json["data_directories"];
            return_error_if_m(j_disks.is_array(), args_wrong_k, "Invalid data directories config");
            for (auto const& j_disk : j_disks) {
                disk_config_t disk_config;
                disk_config.path = j_disk.value("path", "");
                return_error_if_m(!disk_config.path.empty(), args_wrong_k, "Empty data directory path");
                return_error_if_m(parse_volume(j_disk, "max_size", disk_config.max_size),
                                  args_wrong_k,
                                  "Invalid volume format");
                config.data_directories.push_back(std::move(disk_config));
            }
        }

        // Engine
        if (json.contains("engine")) {
            auto const& engine = json["engine"];
            return_error_if_m(engine.is_object(), args_wrong_k, "Invalid engine config");
            config.engine.config_file_path = engine.value("config_file_path", "");
            if (engine.contains("config"))
                config.engine.config = engine["config"];
        }

        // Codec
        if (json.contains("codec")) {
            auto const& codec = json["codec"];
            return_error_if_m(codec.is_object(), args_wrong_k, "Invalid codec config");
            config.codec.format = codec.value("format", "binary");
            config.codec.pooled = codec.value("pooled", false);
        }
        return {};
    });
}

status_t config_loader_t::load_from_json_string(std::string const& str_json,
                                                config_t& config,
                                                bool ignore_comments) noexcept {
    json_t json;
    auto status = safe_section("Parsing config", args_wrong_k, [&] {
        json = json_t::parse(str_json, nullptr, true, ignore_comments);
    });
    return_if_error_m(status);
    return load_from_json(json, config);
}

status_t config_loader_t::save_to_json(config_t const& config, json_t& json) noexcept {
    return safe_section("Saving config", args_wrong_k, [&] {
        json.clear();
        json["version"] = current_version();

        // Main directory
        json["directory"] = config.directory;
        json["flush"] = config.flush;

        // Storage disks
        json_t j_data_directories = json_t::array();
        for (auto const& directory : config.data_directories) {
            json_t j_directory;
            j_directory["path"] = directory.path;
            j_directory["max_size"] = directory.max_size;
            j_data_directories.push_back(std::move(j_directory));
        }
        json["data_directories"] = std::move(j_data_directories);

        // Engine
        json_t j_engine;
        j_engine["config_file_path"] = config.engine.config_file_path;
        j_engine["config"] = config.engine.config;
        json["engine"] = std::move(j_engine);

        // Codec
        json["codec"] = {{"format", config.codec.format}, {"pooled", config.codec.pooled}};
    });
}

status_t config_loader_t::save_to_json_string(config_t const& config, std::string& str_json) noexcept {
    json_t json;
    auto status = save_to_json(config, json);
    return_if_error_m(status);
    return safe_section("Dumping config", args_wrong_k, [&] { str_json = json.dump(); });
}

std::string config_loader_t::current_version() {
    return fmt::format("{}.{}", current_major_version_k, current_minor_version_k);
}

status_t config_loader_t::validate_config(json_t const& json) noexcept {
    return safe_section("Validating config", args_wrong_k, [&]() -> status_t {
        std::string version = json.value("version", std::string());
        uint8_t major_version = 0;
        uint8_t minor_version = 0;
        return_error_if_m(parse_version(version, major_version, minor_version),
                          args_wrong_k,
                          "Invalid version format");
        return_error_if_m(major_version == current_major_version_k && minor_version == current_minor_version_k,
                          args_wrong_k,
                          fmt::format("Version not supported: {}", version));
        return {};
    });
}

bool config_loader_t::parse_version(std::string const& str_version, uint8_t& major, uint8_t& minor) noexcept {

    unsigned long mj = 0;
    unsigned long mn = 0;
    try {
        size_t pos = 0;
        std::string str = str_version;
        if (str.empty() || !std::isdigit(static_cast<unsigned char>(str.front())))
            return false;
        mj = std::stoul(str, &pos);
        if (pos == str.size() || str[pos] != '.')
            return false;
        str = str.substr(++pos);
        if (str.empty() || !std::isdigit(static_cast<unsigned char>(str.front())))
            return false;
        mn = std::stoul(str, &pos);
        if (pos < str.size())
            return false;
    }
    catch (std::exception const&) {
        return false;
    }
    if (mj > std::numeric_limits<uint8_t>::max() || mn > std::numeric_limits<uint8_t>::max())
        return false;

    major = static_cast<uint8_t>(mj);
    minor = static_cast<uint8_t>(mn);
    return true;
}

bool config_loader_t::parse_volume(json_t const& json, std::string const& key, size_t& bytes) noexcept {

    auto it = json.find(key);
    if (it == json.end())
        return true; // Skip if not exist

    switch (it->type()) {
    case json_t::value_t::number_unsigned: {
        bytes = it->get<size_t>();
        return true;
    }
    case json_t::value_t::string: return parse_bytes(it->get_ref<std::string const&>(), bytes);
    default: break;
    }

    return false;
}

bool config_loader_t::parse_bytes(std::string const& str, size_t& bytes) noexcept {

    if (str.empty()) { // Just set zero if it is empty
        bytes = 0;
        return true;
    }

    try {
        // Parse number
        double number = 0.0;
        std::stringstream ss(str);
        if (str.rfind('.', 0) == 0 || (ss >> number).fail() || std::isnan(number) || number < 0)
            return false;

        // Parse unit
        std::string metric;
        if (ss >> metric) {
            if (metric == "KB")
                number *= 1024ull;
            else if (metric == "MB")
                number *= 1024 * 1024ull;
            else if (metric == "GB")
                number *= 1024 * 1024 * 1024ull;
            else if (metric == "TB")
                number *= 1024 * 1024 * 1024 * 1024ull;
            else if (metric != "B" || str.find('.') != std::string::npos)
                return false;
        }
        else if (str.find('.') != std::string::npos)
            return false;

        if (!ss.eof())
            return false;
        if (number >= static_cast<double>(std::numeric_limits<size_t>::max()))
            return false;

        bytes = static_cast<size_t>(number);
        return true;
    }
    catch (std::exception const&) {
        return false;
    }
}

expected_gt<codec_ptr_t> make_codec(codec_config_t const& config) noexcept {
    codec_ptr_t codec;
    status_t status = safe_section("Constructing codec", args_wrong_k, [&]() -> status_t {
        if (config.format == "binary") {
            return_error_if_m(!config.pooled,
                              args_combo_k,
                              "Binary codecs accumulate type definitions and must be primed before pooling");
            codec = std::make_shared<binary_codec_t>();
        }
        else if (config.format == "json")
            codec = config.pooled ? codec_ptr_t(make_pooled(std::make_shared<json_codec_t const>()))
                                  : codec_ptr_t(std::make_shared<json_codec_t>());
        else if (config.format == "xml")
            codec = config.pooled ? codec_ptr_t(make_pooled(std::make_shared<xml_codec_t const>()))
                                  : codec_ptr_t(std::make_shared<xml_codec_t>());
        else
            return {args_wrong_k, fmt::format("Unknown codec format: {}", config.format)};
        return {};
    });
    if (!status)
        return {std::move(status), nullptr};
    return {std::move(codec)};
}

} // namespace unum::ustash
