#include "json_file.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

bool write_json_file(const json& j, const std::string& path, int indent) {
    try {
        fs::path outp(path);
        if (outp.has_parent_path()) fs::create_directories(outp.parent_path());

        // Write to temporary file first
        std::string temp_path = path + ".tmp";
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[Json] Error: Could not open file for writing: " << temp_path << std::endl;
            return false;
        }

        out << j.dump(indent) << "\n";
        out.flush();

        if (!out.good()) {
            std::cerr << "[Json] Error: Write failed for: " << temp_path << std::endl;
            out.close();
            return false;
        }

        out.close();

        // Atomic rename
        if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
            std::cerr << "[Json] Error: Could not rename temp file to " << path << std::endl;
            return false;
        }

        return true;

    } catch (const std::exception& e) {
        std::cerr << "[Json] Error saving " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool read_json_file(const std::string& path, json& out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[Json] Error: could not open " << path << std::endl;
        return false;
    }

    try {
        in >> out;
    } catch (const json::parse_error& e) {
        std::cerr << "[Json] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}
