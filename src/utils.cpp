#include "utils.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::optional<std::vector<unsigned char>> bytes_from_hex(const std::string& hex){
    if(hex.size() % 2 != 0) return std::nullopt;
    auto nibble = [](char c) -> int {
        if(c >= '0' && c <= '9') return c - '0';
        if(c >= 'a' && c <= 'f') return c - 'a' + 10;
        if(c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<unsigned char> out;
    out.reserve(hex.size() / 2);
    for(std::size_t i = 0; i < hex.size(); i += 2){
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if(hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}

std::string sha256_hex(const std::string &data){
    std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if(EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1){
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    out.resize(len);
    return hex_from_bytes(out);
}

std::optional<std::uint64_t> parse_iec_size(const std::string& text){
    std::size_t pos = 0;
    while(pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    std::size_t digits_begin = pos;
    while(pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    if(pos == digits_begin) return std::nullopt;

    std::uint64_t value = 0;
    for(std::size_t i = digits_begin; i < pos; ++i){
        auto digit = static_cast<std::uint64_t>(text[i] - '0');
        if(value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }

    std::string suffix = text.substr(pos);
    while(!suffix.empty() && std::isspace(static_cast<unsigned char>(suffix.back()))) suffix.pop_back();
    if(suffix.size() == 2 && (suffix[1] == 'i' || suffix[1] == 'B')) suffix.pop_back();
    if(suffix.size() > 1) return std::nullopt;

    unsigned shift = 0;
    if(!suffix.empty()){
        switch(std::toupper(static_cast<unsigned char>(suffix[0]))){
            case 'K': shift = 10; break;
            case 'M': shift = 20; break;
            case 'G': shift = 30; break;
            case 'T': shift = 40; break;
            case 'P': shift = 50; break;
            case 'B': shift = 0; break;
            default: return std::nullopt;
        }
    }
    if(shift > 0 && value > (std::numeric_limits<std::uint64_t>::max() >> shift)) return std::nullopt;
    return value << shift;
}

std::string shell_quote(const std::string& value){
    if(!value.empty() &&
       value.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-./:=@,+") == std::string::npos){
        return value;
    }
    std::string out = "'";
    for(char c : value){
        if(c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string join_command(const std::vector<std::string>& argv){
    std::string out;
    for(const auto& arg : argv){
        if(!out.empty()) out += ' ';
        out += shell_quote(arg);
    }
    return out;
}

std::vector<std::string> split_command_line(const std::string& line){
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    bool in_single = false;
    for(std::size_t i = 0; i < line.size(); ++i){
        char c = line[i];
        if(in_single){
            if(c == '\'') in_single = false;
            else current += c;
            continue;
        }
        if(c == '\''){
            in_single = true;
            in_word = true;
        } else if(c == '\\' && i + 1 < line.size()){
            current += line[++i];
            in_word = true;
        } else if(std::isspace(static_cast<unsigned char>(c))){
            if(in_word){
                words.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current += c;
            in_word = true;
        }
    }
    if(in_single) throw std::invalid_argument("unterminated quote in command: " + line);
    if(in_word) words.push_back(current);
    return words;
}
