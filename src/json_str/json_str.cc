#include <chklib/json_str/json_str.hh>

namespace json_str {

void append_stringified_json(std::string& res, std::string_view str) {
    static constexpr char hex_digits[] = "0123456789abcdef";
    res.reserve(res.size() + str.size() + 2);
    res += '"';
    for (char c : str) {
        switch (c) {
        case '"': res += "\\\""; break;
        case '\\': res += "\\\\"; break;
        case '\n': res += "\\n"; break;
        case '\r': res += "\\r"; break;
        case '\t': res += "\\t"; break;
        case '\b': res += "\\b"; break;
        case '\f': res += "\\f"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                res += "\\u00";
                res += hex_digits[static_cast<unsigned char>(c) >> 4];
                res += hex_digits[static_cast<unsigned char>(c) & 15];
            } else {
                res += c;
            }
        }
    }
    res += '"';
}

} // namespace json_str
