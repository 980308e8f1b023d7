// include/utils/wildcard.hh
#ifndef WILDCARD_HH
#define WILDCARD_HH

#include <string>
#include <vector>

class Wildcard {
public:
    // Glob match over the whole string: '*' any run, '?' one character.
    static bool match(const std::string& pattern, const std::string& str) {
        size_t p = 0, s = 0;
        size_t star = std::string::npos, mark = 0;
        while (s < str.size()) {
            if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == str[s])) {
                p++;
                s++;
            } else if (p < pattern.size() && pattern[p] == '*') {
                star = p++;
                mark = s;
            } else if (star != std::string::npos) {
                p = star + 1;
                s = ++mark;
            } else {
                return false;
            }
        }
        while (p < pattern.size() && pattern[p] == '*') p++;
        return p == pattern.size();
    }

    static bool isPattern(const std::string& s) {
        return s.find_first_of("*?") != std::string::npos;
    }

    static std::vector<std::string> filter(const std::string& pattern,
                                           const std::vector<std::string>& names) {
        std::vector<std::string> out;
        for (const auto& n : names) {
            if (match(pattern, n)) out.push_back(n);
        }
        return out;
    }
};

#endif // WILDCARD_HH
