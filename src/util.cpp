#include "../include/util.hpp"
#include "../include/errors.hpp"
#include <openssl/evp.h>
#include <cstdlib>
#include <cstdio>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <memory>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

int getenv_int_or(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v) return def;
    try {
        std::size_t pos = 0;
        int out = std::stoi(v, &pos);
        if (pos != std::string(v).size()) throw std::invalid_argument(v);
        return out;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("invalid integer in ") + key + ": '" + v + "'");
    }
}

double getenv_double_or(const char* key, double def) {
    const char* v = std::getenv(key);
    if (!v) return def;
    try {
        std::size_t pos = 0;
        double out = std::stod(v, &pos);
        if (pos != std::string(v).size()) throw std::invalid_argument(v);
        return out;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("invalid number in ") + key + ": '" + v + "'");
    }
}

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p);
    if (!f) throw std::runtime_error("cannot open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string read_binary_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void write_file_atomic(const std::filesystem::path& p, const std::string& bytes) {
    auto tmp = p;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("cannot open " + tmp.string() + " for write");
        f.write(bytes.data(), (std::streamsize)bytes.size());
        f.flush();
        if (!f) throw std::runtime_error("write failed: " + tmp.string());
    }
    std::filesystem::rename(tmp, p);
}

std::string sha256_hex(const std::string& bytes) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
        throw std::runtime_error("sha256 digest failed");
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(md_len * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        out.push_back(hex[(md[i] >> 4) & 0xF]);
        out.push_back(hex[md[i] & 0xF]);
    }
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool is_blank(const std::string& s) {
    return trim(s).empty();
}

bool is_valid_utf8(const std::string& s) {
    std::size_t i = 0, n = s.size();
    while (i < n) {
        unsigned char c = (unsigned char)s[i];
        std::size_t len;
        unsigned int cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > n) return false;
        for (std::size_t j = 1; j < len; ++j) {
            unsigned char cc = (unsigned char)s[i + j];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string truncate_for_log(const std::string& s, std::size_t n) {
    if (s.size() <= n) return s;
    return s.substr(0, n) + "...";
}
