#include <algorithm>
#include <chklib/config_file.hh>
#include <chklib/ctype.hh>
#include <chklib/file_contents.hh>
#include <utility>

using std::string;

void ConfigFile::load_config_from_file(const string& pathname, bool load_all) {
    load_config_from_string(get_file_contents(pathname), load_all);
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    // Set all variables as unused
    for (auto& [name, var] : vars) {
        var.unset();
    }

    // Checks whether c is a white-space but not a newline
    auto is_ws = [](char c) { return (c != '\n' and is_space(c)); };
    // Checks whether character is one of these [a-zA-Z0-9\-_.]
    auto is_name = [](char c) { return (is_alnum(c) or c == '-' or c == '_' or c == '.'); };

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;

    auto curr_line = [&] {
        return 1 + static_cast<size_t>(std::count(config.begin(), config.begin() + pos, '\n'));
    };

    auto throw_parse_error = [&](auto&&... args) {
        size_t err_pos = std::min(pos, config.size() - 1);
        size_t line_beg = (err_pos == 0 ? string::npos : config.rfind('\n', err_pos - 1));
        line_beg = (line_beg == string::npos ? 0 : line_beg + 1);
        size_t line = 1 + std::count(config.begin(), config.begin() + line_beg, '\n');
        size_t col = err_pos - line_beg + 1; // Indexed from 1

        ParseError pe(line, col, std::forward<decltype(args)>(args)...);

        // Construct diagnostics
        auto& diags = pe.diagnostics_;
        auto append_char = [&](unsigned char c) {
            if (is_print(c)) {
                diags += static_cast<char>(c);
            } else {
                static constexpr char hex_digits[] = "0123456789abcdef";
                diags += "\\x";
                diags += hex_digits[c >> 4];
                diags += hex_digits[c & 15];
            }
        };
        size_t line_end = config.find('\n', err_pos);
        for (size_t k = line_beg; k < line_end; ++k) {
            append_char(config[k]);
        }
        diags += '\n';
        diags.append(err_pos - line_beg, ' ');
        diags += '^';
        throw std::move(pe);
    };

    auto skip_ws = [&] {
        while (is_ws(config[pos])) {
            ++pos;
        }
    };
    auto skip_comment = [&] {
        while (config[pos] != '\n') {
            ++pos;
        }
    };

    auto extract_value = [&](bool is_in_array) {
        string res;
        // Single-quoted string
        if (config[pos] == '\'') {
            while (config[++pos] != '\n') {
                if (config[pos] == '\'') {
                    // Safe (newline is at the end of every line)
                    if (config[pos + 1] != '\'') {
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += config[pos];
            }
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[pos] == '"') {
            while (config[++pos] != '\n') {
                if (config[pos] == '"') {
                    ++pos;
                    return res;
                }
                if (config[pos] != '\\') {
                    res += config[pos];
                    continue;
                }

                // Escape sequence
                switch (config[++pos]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '\\': res += '\\'; continue;
                case 't': res += '\t'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case 'x':
                    // pos will not go out of the buffer - (guard = newline)
                    if (not is_xdigit(config[pos + 1]) or not is_xdigit(config[pos + 2])) {
                        ++pos;
                        throw_parse_error("Invalid hexadecimal escape sequence");
                    }
                    res += static_cast<char>(
                        (hex2dec(config[pos + 1]) << 4) + hex2dec(config[pos + 2])
                    );
                    pos += 2;
                    continue;
                default: throw_parse_error("Unknown escape sequence: `\\", config[pos], '`');
                }
            }
            throw_parse_error("Missing terminating \" character");
        }

        // Bare string literal
        if (config[pos] == '[' or (is_in_array and (config[pos] == ',' or config[pos] == ']'))) {
            throw_parse_error("Invalid beginning of the string literal: `", config[pos], '`');
        }

        size_t beg = pos;
        auto is_terminator = [&](char c) {
            return c == '\n' or c == '#' or (is_in_array and (c == ']' or c == ','));
        };
        while (not is_terminator(config[pos])) {
            ++pos;
        }
        size_t end = pos;
        // Remove white-spaces from ending
        while (end > beg and is_space(config[end - 1])) {
            --end;
        }
        res = config.substr(beg, end - beg);
        return res;
    };

    Variable ignored; // Used for ignored variables
    while (pos < config.size()) {
        skip_ws();
        // Newline
        if (config[pos] == '\n') {
            ++pos;
            continue;
        }
        // Comment
        if (config[pos] == '#') {
            skip_comment();
            ++pos;
            continue;
        }

        /* Variable name */
        size_t name_beg = pos;
        while (is_name(config[pos])) {
            ++pos;
        }
        string name = config.substr(name_beg, pos - name_beg);
        if (name.empty()) {
            throw_parse_error("Invalid or missing variable's name");
        }

        /* Assignment operator */
        skip_ws();
        if (config[pos] == '\n' or config[pos] == '#') {
            throw_parse_error("Incomplete directive: `", name, '`');
        }
        if (config[pos] != '=' and config[pos] != ':') {
            throw_parse_error("Invalid assignment operator: `", config[pos], '`');
        }
        ++pos; // Assignment operator
        skip_ws();

        /* Value */
        Variable* varp = nullptr;
        if (load_all) {
            varp = &vars[name];
        } else {
            auto it = vars.find(name);
            varp = (it != vars.end() ? &it->second : &ignored);
        }
        Variable& var = *varp;
        if (var.is_set()) {
            var.unset(); // The last definition wins
        }
        var.flag_ = Variable::SET;
        var.line_ = curr_line();

        if (config[pos] != '[') { // Normal
            if (config[pos] == '\n' or config[pos] == '#') { // No value
                var.str_.clear();
            } else {
                var.str_ = extract_value(false);
            }
        } else { // Array
            var.flag_ |= Variable::ARRAY;
            ++pos; // Skip [

            for (;;) {
                while (pos < config.size() and is_space(config[pos])) {
                    ++pos;
                }
                if (pos >= config.size()) {
                    throw_parse_error("Missing terminating ] character at the end of an array");
                }

                if (config[pos] == ']') { // End of the array
                    ++pos;
                    break;
                }
                if (config[pos] == '#') { // Comment
                    skip_comment();
                    continue;
                }
                // Ignore extra delimiters
                if (config[pos] == ',') {
                    ++pos;
                    continue;
                }

                // Value
                var.arr_lines_.emplace_back(curr_line());
                var.arr_.emplace_back(extract_value(true));

                skip_ws();
                // Delimiter
                if (config[pos] == ',' or config[pos] == '\n') {
                    ++pos;
                    continue;
                }
                // Comment
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                // End of the array
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }

                // Error - unknown sequence after the value
                throw_parse_error("Unknown sequence after the value: `", config[pos], '`');
            }
        }

        /* After the value */
        skip_ws();
        if (config[pos] == '#') {
            skip_comment();
        }
        // Error - unknown sequence after the value
        if (config[pos] != '\n') {
            throw_parse_error("Unknown sequence after the value: `", config[pos], '`');
        }

        ++pos; // Newline
    }
}
