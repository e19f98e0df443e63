#include "audiobook_resume/core/utils.hpp"
#include "audiobook_resume/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <regex>
#include <sstream>

#include <openssl/evp.h>

namespace audiobook_resume::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

void write_text_atomic(const fs::path& path, const std::string& text) {
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::out | std::ios::trunc);
        if (!file) {
            throw IOError("Cannot create file: " + tmp.string());
        }
        file << text;
        file.flush();
        if (!file) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw IOError("Cannot write file: " + tmp.string());
        }
    }

    // rename() replaces the target in one step on POSIX filesystems
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ec_rm;
        fs::remove(tmp, ec_rm);
        throw IOError("Cannot move " + tmp.string() + " to " + path.string() +
                      ": " + ec.message());
    }
}

bool is_nonempty_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    auto size = fs::file_size(path, ec);
    return !ec && size > 0;
}

std::string line_file_name(int index, const std::string& ext) {
    std::ostringstream oss;
    oss << "line_" << std::setfill('0') << std::setw(6) << index << ext;
    return oss.str();
}

fs::path line_file_path(const fs::path& line_dir, int index, const std::string& ext) {
    return line_dir / line_file_name(index, ext);
}

std::string sanitize_filename(const std::string& text) {
    static const std::string kDropped = "'\":?\\|*<>,;!@#$%^()[]{}=+";

    std::string replaced;
    replaced.reserve(text.size());
    for (char c : text) {
        if (c == '/' || c == '.') {
            replaced.push_back(' ');
        } else if (c == '&') {
            replaced += "and";
        } else if (kDropped.find(c) == std::string::npos) {
            replaced.push_back(c);
        }
    }

    std::istringstream iss(replaced);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return join(words, " ");
}

std::string chapter_file_name(const std::string& title, const std::string& ext) {
    return sanitize_filename(title) + ext;
}

std::string with_extension(const std::string& file_name, const std::string& format) {
    fs::path p(file_name);
    p.replace_extension("." + format);
    return p.string();
}

bool is_plain_file_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

std::string sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw IOError("Cannot allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw IOError("Cannot initialise SHA-256 digest");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(file.gcount())) != 1) {
            EVP_MD_CTX_free(ctx);
            throw IOError("SHA-256 update failed for " + path.string());
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw IOError("SHA-256 finalisation failed for " + path.string());
    }
    EVP_MD_CTX_free(ctx);

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) oss << delimiter;
        oss << parts[i];
    }
    return oss.str();
}

std::string shell_quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

static std::regex compile_glob(const std::string& pattern) {
    std::string regex_pattern;
    for (char c : pattern) {
        switch (c) {
            case '*': regex_pattern += ".*"; break;
            case '?': regex_pattern += "."; break;
            case '[': regex_pattern += "["; break;
            case ']': regex_pattern += "]"; break;
            case '.': case '(': case ')': case '{': case '}': case '+':
            case '^': case '$': case '|': case '\\':
                regex_pattern += '\\';
                regex_pattern += c;
                break;
            default: regex_pattern += c; break;
        }
    }

    try {
        return std::regex(regex_pattern);
    } catch (const std::regex_error& e) {
        throw ValidationError("invalid glob pattern '" + pattern + "': " + e.what());
    }
}

bool is_valid_glob(const std::string& pattern) {
    try {
        compile_glob(pattern);
        return true;
    } catch (const ValidationError&) {
        return false;
    }
}

bool glob_match(const std::string& pattern, const std::string& str) {
    return std::regex_match(str, compile_glob(pattern));
}

std::vector<fs::path> glob(const fs::path& dir, const std::string& pattern) {
    std::vector<fs::path> matches;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return matches;
    }

    const std::regex re = compile_glob(pattern);
    fs::directory_iterator it(dir, ec);
    const fs::directory_iterator end;
    while (!ec && it != end) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) &&
            std::regex_match(it->path().filename().string(), re)) {
            matches.push_back(it->path());
        }
        it.increment(ec);
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

} // namespace audiobook_resume::core
