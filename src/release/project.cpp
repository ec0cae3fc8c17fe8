/// @file project.cpp
/// @brief Project descriptor implementation

#include <addon_forge/release/project.hpp>
#include <addon_forge/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace forge_release {

namespace {

forge_core::Error config_error(const std::filesystem::path& path, const std::string& reason) {
    return forge_core::ReleaseError::config_error(path.string(), reason);
}

/// Read an optional string field, rejecting non-string values
forge_core::Result<void> read_string(
    const nlohmann::json& j, const char* key, std::string& out,
    const std::filesystem::path& source_path) {

    if (!j.contains(key)) {
        return forge_core::Ok();
    }
    if (!j[key].is_string()) {
        return forge_core::Err(config_error(source_path, std::string("'") + key + "' must be a string"));
    }
    out = j[key].get<std::string>();
    return forge_core::Ok();
}

forge_core::Result<void> read_string_list(
    const nlohmann::json& j, const char* key, std::vector<std::string>& out,
    const std::filesystem::path& source_path) {

    if (!j.contains(key)) {
        return forge_core::Ok();
    }
    if (!j[key].is_array()) {
        return forge_core::Err(config_error(source_path, std::string("'") + key + "' must be an array"));
    }
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            return forge_core::Err(config_error(source_path,
                std::string("'") + key + "' must only contain strings"));
        }
        out.push_back(item.get<std::string>());
    }
    return forge_core::Ok();
}

forge_core::Result<void> read_bool(
    const nlohmann::json& j, const char* key, bool& out,
    const std::filesystem::path& source_path) {

    if (!j.contains(key)) {
        return forge_core::Ok();
    }
    if (!j[key].is_boolean()) {
        return forge_core::Err(config_error(source_path, std::string("'") + key + "' must be a boolean"));
    }
    out = j[key].get<bool>();
    return forge_core::Ok();
}

void merge_sorted(std::vector<std::string>& target, const std::vector<std::string>& extra) {
    target.insert(target.end(), extra.begin(), extra.end());
    std::sort(target.begin(), target.end());
    target.erase(std::unique(target.begin(), target.end()), target.end());
}

} // anonymous namespace

// =============================================================================
// ProjectDescriptor Implementation
// =============================================================================

forge_core::Result<ProjectDescriptor> ProjectDescriptor::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return forge_core::Err<ProjectDescriptor>(config_error(path, "file not found"));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return forge_core::Err<ProjectDescriptor>(config_error(path, "failed to open"));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return from_json_string(buffer.str(), path);
}

forge_core::Result<ProjectDescriptor> ProjectDescriptor::from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path) {

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return forge_core::Err<ProjectDescriptor>(
            config_error(source_path, std::string("JSON parse error: ") + e.what()));
    }

    if (!j.is_object()) {
        return forge_core::Err<ProjectDescriptor>(config_error(source_path, "root must be an object"));
    }

    ProjectDescriptor project;

    // Name (required)
    if (!j.contains("name") || !j["name"].is_string()) {
        return forge_core::Err<ProjectDescriptor>(config_error(source_path, "missing 'name'"));
    }
    project.name = j["name"].get<std::string>();

    // Optional metadata fields
    std::string version;
    if (auto r = read_string(j, "prefix", project.prefix, source_path); !r) {
        return forge_core::Err<ProjectDescriptor>(r.error());
    }
    if (auto r = read_string(j, "author", project.author, source_path); !r) {
        return forge_core::Err<ProjectDescriptor>(r.error());
    }
    if (auto r = read_string(j, "version", version, source_path); !r) {
        return forge_core::Err<ProjectDescriptor>(r.error());
    }
    if (auto r = read_string(j, "modname", project.modname, source_path); !r) {
        return forge_core::Err<ProjectDescriptor>(r.error());
    }
    if (auto r = read_string(j, "keyname", project.keyname, source_path); !r) {
        return forge_core::Err<ProjectDescriptor>(r.error());
    }
    if (!version.empty()) {
        project.version = version;
    }

    // Lists
    if (auto r = read_string_list(j, "files", project.files, source_path); !r) {
        return forge_core::Err<ProjectDescriptor>(r.error());
    }
    std::vector<std::string> optionals;
    if (auto r = read_string_list(j, "optionals", optionals, source_path); !r) {
        return forge_core::Err<ProjectDescriptor>(r.error());
    }
    std::vector<std::string> skip;
    if (auto r = read_string_list(j, "skip", skip, source_path); !r) {
        return forge_core::Err<ProjectDescriptor>(r.error());
    }
    project.add_optionals(optionals);
    project.add_skips(skip);

    // Flags
    if (auto r = read_bool(j, "reuse_private_key", project.reuse_private_key, source_path); !r) {
        return forge_core::Err<ProjectDescriptor>(r.error());
    }
    if (auto r = read_bool(j, "folder_optionals", project.folder_optionals, source_path); !r) {
        return forge_core::Err<ProjectDescriptor>(r.error());
    }

    forge_core::release_logger()->debug("Loaded project '{}' (mod '{}', key '{}')",
        project.name, project.get_modname(), project.get_keyname());

    return forge_core::Ok(std::move(project));
}

std::string ProjectDescriptor::to_json_string() const {
    nlohmann::json j;
    j["name"] = name;
    if (!prefix.empty()) j["prefix"] = prefix;
    if (!author.empty()) j["author"] = author;
    if (version) j["version"] = *version;
    if (!modname.empty()) j["modname"] = modname;
    if (!keyname.empty()) j["keyname"] = keyname;
    j["files"] = files;
    j["optionals"] = optionals;
    j["skip"] = skip;
    j["reuse_private_key"] = reuse_private_key;
    j["folder_optionals"] = folder_optionals;
    return j.dump(2);
}

std::string ProjectDescriptor::get_modname() const {
    if (!modname.empty()) {
        return modname;
    }
    if (!prefix.empty()) {
        return prefix;
    }
    return name;
}

std::string ProjectDescriptor::get_keyname() const {
    if (!keyname.empty()) {
        return keyname;
    }
    return get_modname();
}

std::optional<std::string> ProjectDescriptor::archive_prefix() const {
    if (prefix.empty()) {
        return std::nullopt;
    }
    return prefix;
}

bool ProjectDescriptor::is_optional_selected(const std::string& addon_name) const {
    return std::find(optionals.begin(), optionals.end(), "all") != optionals.end() ||
           std::find(optionals.begin(), optionals.end(), addon_name) != optionals.end();
}

bool ProjectDescriptor::is_skipped(const std::string& addon_name) const {
    return std::find(skip.begin(), skip.end(), addon_name) != skip.end();
}

void ProjectDescriptor::add_optionals(const std::vector<std::string>& names) {
    merge_sorted(optionals, names);
}

void ProjectDescriptor::add_skips(const std::vector<std::string>& names) {
    merge_sorted(skip, names);
}

// =============================================================================
// Free Functions
// =============================================================================

forge_core::Result<std::filesystem::path> find_project_root(const std::filesystem::path& start) {
    std::error_code ec;
    auto current = std::filesystem::absolute(start, ec);
    if (ec) {
        return forge_core::Err<std::filesystem::path>(
            forge_core::ReleaseError::io_failure(start.string(), ec.message()));
    }

    while (true) {
        if (std::filesystem::is_regular_file(current / k_project_file_name, ec)) {
            return forge_core::Ok(current);
        }
        auto parent = current.parent_path();
        if (parent.empty() || parent == current) {
            break;
        }
        current = parent;
    }

    return forge_core::Err<std::filesystem::path>(config_error(start,
        std::string("no ") + k_project_file_name + " found in this directory or any parent"));
}

std::vector<std::string> split_name_list(const std::string& list) {
    std::vector<std::string> names;
    std::string current;
    std::istringstream stream(list);
    while (std::getline(stream, current, ',')) {
        if (!current.empty()) {
            names.push_back(current);
        }
    }
    return names;
}

} // namespace forge_release
