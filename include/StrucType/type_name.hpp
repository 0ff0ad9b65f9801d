#pragma once

#include <string_view>

namespace StrucType {

namespace type_name_detail {

template<class T>
constexpr std::string_view signature() {
    return __PRETTY_FUNCTION__;
}

// GCC:   "... signature() [with T = ns::UserStruct; std::string_view = ...]"
// Clang: "... signature() [T = ns::UserStruct]"
constexpr std::string_view extract(std::string_view sig) {
    constexpr std::string_view marker = "T = ";
    std::size_t begin = sig.find(marker);
    if(begin == std::string_view::npos) {
        return sig;
    }
    begin += marker.size();
    std::size_t end = begin;
    int depth = 0;
    for(; end < sig.size(); end ++) {
        char c = sig[end];
        if(c == '<' || c == '(' || c == '[') {
            depth ++;
        } else if(c == '>' || c == ')') {
            depth --;
        } else if(c == ']') {
            if(depth == 0) break;
            depth --;
        } else if(c == ';' && depth == 0) {
            break;
        }
    }
    return sig.substr(begin, end - begin);
}

}

// Human-readable name of T, used in diagnostics
template<class T>
constexpr std::string_view TypeName() {
    return type_name_detail::extract(type_name_detail::signature<T>());
}

}
