#include "common/json_utils.hpp"

namespace grader {
using namespace std;

/**
 * @return 从 pos 开始的合法 UTF-8 字符的字节数，不合法时返回 0
 */
static size_t utf8_sequence_length(const string &str, size_t pos) {
    auto c = (unsigned char)str[pos];
    size_t n;
    if (c <= 0x7f) return 1;
    else if (c >= 0xc2 && c <= 0xdf) n = 2;
    else if ((c & 0xf0) == 0xe0) n = 3;
    else if (c >= 0xf0 && c <= 0xf4) n = 4;
    else return 0;

    if (pos + n > str.size()) return 0;
    for (size_t i = 1; i < n; ++i)
        if (((unsigned char)str[pos + i] & 0xc0) != 0x80) return 0;
    // 代理区 U+D800 到 U+DFFF
    if (c == 0xed && (unsigned char)str[pos + 1] >= 0xa0) return 0;
    return n;
}

string ensure_utf8(const string &str) {
    string result;
    result.reserve(str.size());
    for (size_t pos = 0; pos < str.size();) {
        size_t n = utf8_sequence_length(str, pos);
        if (n == 0) {
            result += "\xef\xbf\xbd";  // U+FFFD
            ++pos;
        } else {
            result.append(str, pos, n);
            pos += n;
        }
    }
    return result;
}

}  // namespace grader
