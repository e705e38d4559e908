#pragma once
#include <algorithm>
#include <cctype>
#include <map>
#include <string>

// "type/subtype; key=value; ..." with case-insensitive type and keys.
struct MimeType {
    std::string type;
    std::string subtype;
    std::map<std::string, std::string> params;

    static MimeType parse(const std::string& text) {
        MimeType m;
        auto semi = text.find(';');
        std::string essence = trim(text.substr(0, semi));
        auto slash = essence.find('/');
        if (slash != std::string::npos) {
            m.type    = lower(trim(essence.substr(0, slash)));
            m.subtype = lower(trim(essence.substr(slash + 1)));
        } else {
            m.type = lower(essence);
        }

        while (semi != std::string::npos) {
            auto next = text.find(';', semi + 1);
            std::string param = text.substr(semi + 1,
                next == std::string::npos ? std::string::npos : next - semi - 1);
            auto eq = param.find('=');
            if (eq != std::string::npos) {
                std::string val = trim(param.substr(eq + 1));
                if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
                    val = val.substr(1, val.size() - 2);
                m.params[lower(trim(param.substr(0, eq)))] = val;
            }
            semi = next;
        }
        return m;
    }

    std::string essence() const { return type + "/" + subtype; }

    int intParam(const std::string& key, int defaultVal) const {
        auto it = params.find(key);
        if (it == params.end()) return defaultVal;
        try {
            return std::stoi(it->second);
        } catch (const std::exception&) {
            return defaultVal;
        }
    }

    bool isWav() const {
        return type == "audio" &&
               (subtype == "wav" || subtype == "x-wav" || subtype == "wave" ||
                subtype == "vnd.wave");
    }

    std::string str() const {
        std::string s = essence();
        for (auto& [k, v] : params)
            s += ";" + k + "=" + v;
        return s;
    }

private:
    static std::string trim(const std::string& s) {
        auto b = s.find_first_not_of(" \t");
        if (b == std::string::npos) return "";
        auto e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }
};
