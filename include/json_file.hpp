#pragma once
// json_file.hpp
// Small helpers around nlohmann::json for the artifacts this tool persists.
// Writes go to "<path>.tmp" first and are renamed into place, so a reader never sees half a file.

#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// indent < 0 writes compact JSON. Creates missing parent directories.
bool write_json_file(const json& j, const std::string& path, int indent = 2);

// Returns false (and logs) if the file is missing or not valid JSON
bool read_json_file(const std::string& path, json& out);
