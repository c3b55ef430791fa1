#pragma once
// corpus_loader.hpp
// Plain data types shared by the whole pipeline (source corpora and tagged records)
// plus the loader that reads one newline-delimited source file into memory.
// NUL bytes are stripped from every line, the file size is kept for the summary.

#include <cstdint>
#include <string>
#include <vector>

// One source corpus as read from disk: ordered lines plus its identifying name
struct SourceCorpus {
    std::string name;
    std::string path;
    std::uintmax_t size_bytes = 0;
    std::vector<std::string> lines;
};

// One line of text tagged with the source it was sampled from
struct Record {
    std::string text;
    std::string source;
};

// Reads every line of `path` into `out`. Returns false (and logs) when the file cannot be opened.
bool load_source_corpus(const std::string& name, const std::string& path, SourceCorpus& out);

// Builds an in-memory corpus (size_bytes is the byte count of the lines plus their newlines)
SourceCorpus make_source_corpus(const std::string& name, std::vector<std::string> lines);
