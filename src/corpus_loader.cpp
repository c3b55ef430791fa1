#include "corpus_loader.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

bool load_source_corpus(const std::string& name, const std::string& path, SourceCorpus& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[Loader] Error: could not open " << path << std::endl;
        return false;
    }

    out.name = name;
    out.path = path;
    out.lines.clear();

    std::error_code ec;
    out.size_bytes = fs::file_size(path, ec);
    if (ec) {
        std::cerr << "[Loader] Warning: could not stat " << path << ": " << ec.message() << std::endl;
        out.size_bytes = 0;
    }

    std::string line;
    size_t nul_lines = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        auto nul = std::remove(line.begin(), line.end(), '\0');
        if (nul != line.end()) {
            line.erase(nul, line.end());
            nul_lines++;
        }
        out.lines.push_back(std::move(line));
        line.clear();
    }

    std::cout << "[Loader] " << name << ": " << out.lines.size() << " lines from " << path << std::endl;
    if (nul_lines > 0) {
        std::cout << "[Loader] " << name << ": stripped NUL bytes from " << nul_lines << " lines" << std::endl;
    }
    return true;
}

SourceCorpus make_source_corpus(const std::string& name, std::vector<std::string> lines) {
    SourceCorpus corpus;
    corpus.name = name;
    for (const auto& line : lines) corpus.size_bytes += line.size() + 1;
    corpus.lines = std::move(lines);
    return corpus;
}
