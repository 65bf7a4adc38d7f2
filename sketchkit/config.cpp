#include "sketchkit/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <string_view>
#include <utility>
#include <vector>

namespace sketchkit {

namespace {

std::string Trim(const std::string& s) {
    size_t begin = 0, end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

bool ParseUnsigned(const std::string& value, uint64_t& out) {
    if (value.empty() || value[0] == '-') {
        return false;
    }
    try {
        size_t pos = 0;
        out = std::stoull(value, &pos);
        return pos == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseInt(const std::string& value, int& out) {
    try {
        size_t pos = 0;
        out = std::stoi(value, &pos);
        return pos == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseDouble(const std::string& value, double& out) {
    try {
        size_t pos = 0;
        out = std::stod(value, &pos);
        return pos == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseBool(const std::string& value, bool& out) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

using Setter = std::function<bool(SketchConfig&, const std::string&)>;

Setter SizeField(size_t SketchConfig::*field) {
    return [field](SketchConfig& config, const std::string& value) {
        uint64_t v;
        if (!ParseUnsigned(value, v)) {
            return false;
        }
        config.*field = static_cast<size_t>(v);
        return true;
    };
}

Setter U64Field(uint64_t SketchConfig::*field) {
    return [field](SketchConfig& config, const std::string& value) {
        return ParseUnsigned(value, config.*field);
    };
}

Setter IntField(int SketchConfig::*field) {
    return [field](SketchConfig& config, const std::string& value) {
        return ParseInt(value, config.*field);
    };
}

Setter DoubleField(double SketchConfig::*field) {
    return [field](SketchConfig& config, const std::string& value) {
        return ParseDouble(value, config.*field);
    };
}

Setter BoolField(bool SketchConfig::*field) {
    return [field](SketchConfig& config, const std::string& value) {
        return ParseBool(value, config.*field);
    };
}

Setter StringField(std::string SketchConfig::*field) {
    return [field](SketchConfig& config, const std::string& value) {
        config.*field = value;
        return true;
    };
}

const std::vector<std::pair<std::string, Setter>>& Fields() {
    static const std::vector<std::pair<std::string, Setter>> fields = {
        {"bloom_capacity", SizeField(&SketchConfig::bloom_capacity)},
        {"bloom_false_positive_rate", DoubleField(&SketchConfig::bloom_false_positive_rate)},
        {"hll_precision", IntField(&SketchConfig::hll_precision)},
        {"cms_width", SizeField(&SketchConfig::cms_width)},
        {"cms_depth", SizeField(&SketchConfig::cms_depth)},
        {"cuckoo_capacity", SizeField(&SketchConfig::cuckoo_capacity)},
        {"cuckoo_bucket_size", SizeField(&SketchConfig::cuckoo_bucket_size)},
        {"cuckoo_fingerprint_size", SizeField(&SketchConfig::cuckoo_fingerprint_size)},
        {"cuckoo_max_relocations", SizeField(&SketchConfig::cuckoo_max_relocations)},
        {"minhash_num_perm", SizeField(&SketchConfig::minhash_num_perm)},
        {"minhash_seed", U64Field(&SketchConfig::minhash_seed)},
        {"topk_k", SizeField(&SketchConfig::topk_k)},
        {"topk_width", SizeField(&SketchConfig::topk_width)},
        {"topk_depth", SizeField(&SketchConfig::topk_depth)},
        {"seed", U64Field(&SketchConfig::seed)},
        {"hash_function", StringField(&SketchConfig::hash_function)},
        {"verbose_logging", BoolField(&SketchConfig::verbose_logging)},
        {"log_level", StringField(&SketchConfig::log_level)},
    };
    return fields;
}

}  // namespace

bool SketchConfig::Set(const std::string& key, const std::string& value) {
    for (auto& [name, setter] : Fields()) {
        if (name == key) {
            if (!setter(*this, value)) {
                std::cerr << "invalid value for " << key << ": " << value << std::endl;
                return false;
            }
            return true;
        }
    }
    std::cerr << "unknown config key: " << key << std::endl;
    return true;
}

bool SketchConfig::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "Failed to open config file: " << path << std::endl;
        return false;
    }
    bool ok = true;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = Trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << path << ":" << line_no << ": expected key = value" << std::endl;
            ok = false;
            continue;
        }
        if (!Set(Trim(line.substr(0, eq)), Trim(line.substr(eq + 1)))) {
            ok = false;
        }
    }
    return ok;
}

void SketchConfig::LoadFromEnv() {
    for (auto& [name, setter] : Fields()) {
        std::string env_name = "SKETCHKIT_" + name;
        std::transform(env_name.begin(), env_name.end(), env_name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        const char* value = std::getenv(env_name.c_str());
        if (value == nullptr) {
            continue;
        }
        if (!setter(*this, Trim(value))) {
            std::cerr << "ignoring invalid " << env_name << "=" << value << std::endl;
        }
    }
}

}  // namespace sketchkit
