#include "token_filter.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace std;

TokenFilter::TokenFilter(unordered_set<string> stopwords, unordered_set<string> profanity) {
    // Keep the lookup side normalized no matter who built the sets
    for (const auto& w : stopwords) {
        string n = normalize_entry(w);
        if (!n.empty()) stop_words_.insert(n);
    }
    for (const auto& w : profanity) {
        string n = normalize_entry(w);
        if (!n.empty()) profanity_.insert(n);
    }
}

TokenFilter TokenFilter::from_files(const string& stopwords_path, const string& profanity_path) {
    auto stopwords = load_word_list(stopwords_path);
    auto profanity = load_word_list(profanity_path);
    cout << "[Filter] Loaded " << stopwords.size() << " stopwords and "
         << profanity.size() << " profanity entries" << endl;
    return TokenFilter(move(stopwords), move(profanity));
}

// Lowercase and keep letters only
string TokenFilter::normalize_entry(const string& word) {
    string out;
    out.reserve(word.size());
    for (unsigned char c : word) {
        if (isalpha(c) && c < 0x80) out.push_back(static_cast<char>(tolower(c)));
    }
    return out;
}

// Load a word list from file
unordered_set<string> TokenFilter::load_word_list(const string& path) {
    ifstream in(path);
    if (!in.is_open()) throw runtime_error("Word list file not found: " + path);

    unordered_set<string> words;
    string line;
    while (getline(in, line)) {
        replace(line.begin(), line.end(), ',', ' ');
        size_t pos = 0;
        while (pos < line.size()) {
            auto start = line.find_first_not_of(" \t\r\n", pos);
            if (start == string::npos) break;
            auto end = line.find_first_of(" \t\r\n", start);
            if (end == string::npos) end = line.size();

            string tok = normalize_entry(line.substr(start, end - start));
            if (!tok.empty()) words.insert(tok);
            pos = end;
        }
    }

    if (words.empty()) {
        cerr << "[Filter] Warning: word list " << path << " is empty" << endl;
    }
    return words;
}

bool TokenFilter::is_stopword(const string& token) const {
    string w = token;
    transform(w.begin(), w.end(), w.begin(), [](unsigned char c){ return tolower(c); });
    return stop_words_.count(w) > 0;
}

bool TokenFilter::is_profane(const string& token) const {
    string w = token;
    transform(w.begin(), w.end(), w.begin(), [](unsigned char c){ return tolower(c); });
    return profanity_.count(w) > 0;
}

bool TokenFilter::is_excluded(const string& token) const {
    return is_stopword(token) || is_profane(token);
}

vector<string> TokenFilter::apply(const NGramSequence& words) const {
    vector<string> kept;
    kept.reserve(words.size());
    for (auto it = words.begin(); it != words.end(); ++it) {
        string w = *it;
        if (!is_excluded(w)) kept.push_back(move(w));
    }
    return kept;
}

vector<string> TokenFilter::apply(const vector<string>& words) const {
    vector<string> kept;
    kept.reserve(words.size());
    for (const auto& w : words) {
        if (!is_excluded(w)) kept.push_back(w);
    }
    return kept;
}
