#pragma once

#include <chklib/concat_tostr.hh>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        explicit ParseError(const std::string& msg) : runtime_error(msg) {}

        template <class... Args>
        ParseError(size_t line, size_t pos, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...)) {}

        ParseError(const ParseError& pe) = default;
        ParseError(ParseError&&) noexcept = default;
        ParseError& operator=(const ParseError& pe) = default;
        ParseError& operator=(ParseError&&) noexcept = default;

        using runtime_error::what;

        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

        ~ParseError() noexcept override = default;

        friend class ConfigFile;
    };

    class Variable {
    public:
        static constexpr uint8_t SET = 1; // set if variable appears in the config
        static constexpr uint8_t ARRAY = 2; // set if variable is an array

    private:
        uint8_t flag_ = 0;
        size_t line_ = 0;
        std::string str_;
        std::vector<std::string> arr_;
        std::vector<size_t> arr_lines_;

        void unset() noexcept {
            flag_ = 0;
            line_ = 0;
            str_.clear();
            arr_.clear();
            arr_lines_.clear();
        }

    public:
        [[nodiscard]] bool is_set() const noexcept { return flag_ & SET; }

        [[nodiscard]] bool is_array() const noexcept { return flag_ & ARRAY; }

        // Line at which the variable's definition begins (0 if not set)
        [[nodiscard]] size_t line() const noexcept { return line_; }

        // Returns value as string (empty if not a string or variable isn't set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Returns value as array (empty if not an array or variable isn't set)
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }

        // Line of every array element, parallel to as_array()
        [[nodiscard]] const std::vector<size_t>& array_lines() const noexcept {
            return arr_lines_;
        }

        friend class ConfigFile;
    };

private:
    std::map<std::string, Variable, std::less<>> vars; // (name => value)
    static const Variable null_var;

public:
    ConfigFile() = default;

    ConfigFile(const ConfigFile&) = default;
    ConfigFile(ConfigFile&&) noexcept = default;
    ConfigFile& operator=(const ConfigFile&) = default;
    ConfigFile& operator=(ConfigFile&&) noexcept = default;

    ~ConfigFile() = default;

    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars.emplace(std::forward<Args>(names), Variable{}), ...);
    }

    // Returns a reference to a variable @p name from variable set or to a
    // null_var
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars.find(name);
        return (it != vars.end() ? it->second : null_var);
    }

    [[nodiscard]] const decltype(vars)& get_vars() const { return vars; }

    /**
     * @brief Loads config (variables) form file @p pathname
     * @details Uses load_config_from_string()
     *
     * @param pathname config file
     * @param load_all whether load all variables from @p pathname or load only
     *   these from variable set
     *
     * @errors Throws an exception std::runtime_error if reading the file fails
     *   and all exceptions from load_config_from_string()
     */
    void load_config_from_file(const std::string& pathname, bool load_all = false);

    /**
     * @brief Loads config (variables) form string @p config
     * @details Syntax: one `name: value` (or `name = value`) per line, where
     *   value is a bare string (ends at a newline or '#'), a single-quoted
     *   string ('' stands for '), a double-quoted string with C escapes or an
     *   array `[ v1, v2 ... ]` whose values are separated by commas or
     *   newlines. '#' starts a comment.
     *
     * @param config input string
     * @param load_all whether load all variables from @p config or load only
     *   these from variable set
     *
     * @errors Throws an exception (ParseError) if an error occurs
     */
    void load_config_from_string(std::string config, bool load_all = false);
};

inline const ConfigFile::Variable ConfigFile::null_var{};
