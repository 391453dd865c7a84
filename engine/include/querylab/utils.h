#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace querylab {

inline std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){return std::tolower(c);});
    return s;
}

inline std::string to_upper(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){return std::toupper(c);});
    return s;
}

inline std::string trim(const std::string &s){
    size_t i=0,j=s.size();
    while(i<j && std::isspace((unsigned char)s[i])) ++i;
    while(j>i && std::isspace((unsigned char)s[j-1])) --j;
    return s.substr(i,j-i);
}

inline bool iequals(const std::string &a, const std::string &b){
    if(a.size()!=b.size()) return false;
    for(size_t k=0;k<a.size();++k)
        if(std::tolower((unsigned char)a[k])!=std::tolower((unsigned char)b[k])) return false;
    return true;
}

inline std::string join(const std::vector<std::string> &parts, const std::string &sep){
    std::ostringstream oss;
    for(size_t k=0;k<parts.size();++k){ if(k) oss << sep; oss << parts[k]; }
    return oss.str();
}

inline int levenshtein(const std::string &a, const std::string &b){
    int n=a.size(), m=b.size();
    std::vector<int> prev(m+1), cur(m+1);
    for(int j=0;j<=m;++j) prev[j]=j;
    for(int i=1;i<=n;++i){
        cur[0]=i;
        for(int j=1;j<=m;++j){
            int cost = (a[i-1]==b[j-1]?0:1);
            cur[j]=std::min({prev[j]+1, cur[j-1]+1, prev[j-1]+cost});
        }
        std::swap(prev,cur);
    }
    return prev[m];
}

// Similarity in [0,1]; 1 means identical (case-insensitive).
inline double similarity(const std::string &a, const std::string &b){
    size_t longest = std::max(a.size(), b.size());
    if(longest==0) return 1.0;
    return 1.0 - double(levenshtein(to_lower(a), to_lower(b))) / double(longest);
}

// Closest candidate with similarity >= cutoff, or empty.
inline std::string closest_match(const std::string &word, const std::vector<std::string> &candidates, double cutoff=0.6){
    double best=-1.0; std::string cand;
    for(const auto &c: candidates){
        double s = similarity(word, c);
        if(s>=cutoff && s>best){ best=s; cand=to_lower(c); }
    }
    return cand;
}

} // namespace querylab
